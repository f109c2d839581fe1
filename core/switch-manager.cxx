#include "core/switch-manager.hxx"
#include "core/errors.hxx"

using std::string;
using namespace spanwire;

SwitchCapacityManager::SwitchCapacityManager(
    Connection & conn,
    NetworkDirectory & directory,
    const ProviderNetworkConfigurator & configurator,
    size_t max_ports_per_switch,
    size_t page_length)
  : conn_{conn},
    directory_{directory},
    configurator_{configurator},
    max_ports_per_switch_{max_ports_per_switch},
    page_length_{page_length}
{}

size_t SwitchCapacityManager::maxPortsPerSwitch() const
{
  return max_ports_per_switch_;
}

SwitchCapacityManager & SwitchCapacityManager::maxPortsPerSwitch(size_t n)
{
  max_ports_per_switch_ = n;
  return *this;
}

SwitchCursor
SwitchCapacityManager::lswitchesForNetwork(const string & network_id) const
{
  Query q;
  q.field("uuid")
   .field("display_name")
   .field("transport_zones")
   .relation(relation::SwitchStatus)
   .tag(scope::Network, network_id)
   .pageLength(page_length_);

  Connection & conn = conn_;
  return SwitchCursor{
    [&conn](const Query & x){ return conn.querySwitches(x); },
    q
  };
}

bool SwitchCapacityManager::hasRoom(const Json & lswitch) const
{
  if(max_ports_per_switch_ == 0) return true;
  return lportCount(lswitch) < max_ports_per_switch_;
}

SelectedSwitch
SwitchCapacityManager::selectOrCreateSwitch(const Context & ctx,
                                            const string & network_id)
{
  Json switches = lswitchesForNetwork(network_id).results();

  optional<NetworkDetails> details =
    extractor_.extract(switches, directory_.located(network_id));
  if(!details)
  {
    LOG(ERROR) << "no provider context for network " << network_id;
    throw BadNVPState{network_id};
  }

  for(const Json & sw : extract(switches, "results", "lswitch-query"))
  {
    if(!hasRoom(sw)) continue;

    SelectedSwitch s;
    s.uuid = extract(sw, "uuid", "lswitch").get<string>();
    VLOG(1) << "network " << network_id << " using switch " << s.uuid;
    return s;
  }

  LOG(INFO) << "network " << network_id << " has no switch with room, "
            << "spanning onto a new switch";

  SelectedSwitch s;
  s.uuid = createSwitch(
      ctx,
      network_id,
      details->network_name.value_or(network_id),
      details->providerParams());
  s.created = true;
  return s;
}

string SwitchCapacityManager::createNetwork(const Context & ctx,
                                            const string & network_id,
                                            const string & name,
                                            const ProviderNetworkParams & p)
{
  return createSwitch(ctx, network_id, name, p);
}

string SwitchCapacityManager::createSwitch(const Context & ctx,
                                           const string & network_id,
                                           const string & name,
                                           const ProviderNetworkParams & p)
{
  LSwitch sw;
  sw.displayName(name)
    .tag(scope::Tenant, ctx.tenant_id)
    .tag(scope::Network, network_id);

  //throws before anything is created on the controller
  configurator_.configure(sw, p);

  Json res = conn_.createSwitch(sw);
  string uuid = extract(res, "uuid", "lswitch-create").get<string>();
  LOG(INFO) << "created lswitch " << uuid << " for network " << network_id;
  return uuid;
}

size_t SwitchCapacityManager::deleteNetwork(const string & network_id)
{
  Json switches = lswitchesForNetwork(network_id).results();

  size_t n{0};
  for(const Json & sw : extract(switches, "results", "lswitch-query"))
  {
    string uuid = extract(sw, "uuid", "lswitch").get<string>();
    try
    {
      conn_.deleteSwitch(uuid);
      LOG(INFO) << "deleted lswitch " << uuid;
    }
    catch(ControllerNotFound &)
    {
      LOG(WARNING) << "lswitch " << uuid << " already gone";
    }
    ++n;
  }

  if(n == 0)
    LOG(INFO) << "network " << network_id << " has no switches to delete";

  return n;
}
