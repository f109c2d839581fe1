#include <set>
#include "core/port-allocator.hxx"
#include "core/errors.hxx"

using std::string;
using std::set;
using std::move;

using namespace spanwire;

Json CreatedPort::json() const
{
  Json j;
  j["uuid"] = uuid;
  j["lswitch"] = lswitch;
  return j;
}

PortAllocator::PortAllocator(Connection & conn,
                             SwitchCapacityManager & switches)
  : conn_{conn},
    switches_{switches}
{}

CreatedPort PortAllocator::createPort(const Context & ctx,
                                      const string & network_id,
                                      const string & port_id,
                                      bool admin_status_enabled)
{
  SelectedSwitch sw = switches_.selectOrCreateSwitch(ctx, network_id);

  LPort port;
  port.adminStatusEnabled(admin_status_enabled)
      .tag(scope::Tenant, ctx.tenant_id)
      .tag(scope::Network, network_id)
      .tag(scope::Port, port_id);

  Json res = conn_.createPort(sw.uuid, port);

  CreatedPort p;
  p.uuid = extract(res, "uuid", "lport-create").get<string>();
  p.lswitch = sw.uuid;
  LOG(INFO) << "created lport " << p.uuid << " for port " << port_id
            << " on lswitch " << sw.uuid;
  return p;
}

string PortAllocator::hostOf(const string & port_id)
{
  Query q;
  q.field("uuid")
   .relation(relation::SwitchConfig)
   .uuid(port_id);

  Json res = conn_.queryPorts(q);

  set<string> hosts;
  for(const Json & p : extract(res, "results", "lport-query"))
    hosts.insert(hostingSwitch(p));

  if(hosts.size() != 1)
  {
    LOG(ERROR) << "port " << port_id << " found on " << hosts.size()
               << " switches";
    throw AmbiguousPortPlacement{port_id, hosts.size()};
  }

  return *hosts.begin();
}

void PortAllocator::deleteNetworkPort(const string & port_id,
                                      optional<string> switch_uuid)
{
  string host = switch_uuid ? *switch_uuid : hostOf(port_id);
  conn_.deletePort(host, port_id);
  LOG(INFO) << "deleted lport " << port_id << " from lswitch " << host;
}
