#include <fstream>
#include <sstream>
#include <fmt/format.h>
#include "core/driver.hxx"

using std::string;
using std::vector;
using std::shared_ptr;
using std::ifstream;
using std::stringstream;
using std::runtime_error;
using std::move;

using namespace spanwire;

// DriverConfig ----------------------------------------------------------------

Json DriverConfig::json() const
{
  Json j;
  j["controllers"] = controllers;
  j["user"] = user;
  j["password"] = password;
  j["max-ports-per-switch"] = max_ports_per_switch;
  j["page-length"] = page_length;
  j["recv-window"] = recv_window;
  return j;
}

DriverConfig DriverConfig::fromJson(const Json & j)
{
  DriverConfig c;
  c.controllers =
    extract(j, "controllers", "config").get<vector<string>>();

  if(auto x = maybeExtract(j, "user")) c.user = x->get<string>();
  if(auto x = maybeExtract(j, "password")) c.password = x->get<string>();
  if(auto x = maybeExtract(j, "max-ports-per-switch"))
    c.max_ports_per_switch = x->get<size_t>();
  if(auto x = maybeExtract(j, "page-length"))
    c.page_length = x->get<size_t>();
  if(auto x = maybeExtract(j, "recv-window"))
    c.recv_window = x->get<size_t>();

  return c;
}

DriverConfig DriverConfig::load(const string & path)
{
  ifstream in{path};
  if(!in.good())
  {
    LOG(ERROR) << "unable to open config " << path;
    throw runtime_error{fmt::format("config {} could not be read", path)};
  }

  stringstream ss;
  ss << in.rdbuf();
  return fromJson(Json::parse(ss.str()));
}

// Driver ----------------------------------------------------------------------

Driver::Driver(DriverConfig config,
               shared_ptr<Connection> conn,
               shared_ptr<NetworkDirectory> directory)
  : config_{move(config)},
    conn_{move(conn)},
    directory_{move(directory)},
    zones_{*conn_},
    configurator_{zones_},
    switches_{*conn_,
              *directory_,
              configurator_,
              config_.max_ports_per_switch,
              config_.page_length},
    ports_{*conn_, switches_}
{
  LOG(INFO) << "driver ready, max ports per switch: "
            << config_.max_ports_per_switch;
}

string Driver::createNetwork(const Context & ctx,
                             const string & network_id,
                             const string & name,
                             const ProviderNetworkParams & p)
{
  LOG(INFO) << fmt::format("[{}] create network {} ({}) {}",
                           ctx.tenant_id, network_id, name, p.json().dump());
  return switches_.createNetwork(ctx, network_id, name, p);
}

void Driver::deleteNetwork(const Context & ctx, const string & network_id)
{
  LOG(INFO) << fmt::format("[{}] delete network {}",
                           ctx.tenant_id, network_id);
  switches_.deleteNetwork(network_id);
}

CreatedPort Driver::createPort(const Context & ctx,
                               const string & network_id,
                               const string & port_id,
                               bool admin_status_enabled)
{
  LOG(INFO) << fmt::format("[{}] create port {} on network {}",
                           ctx.tenant_id, port_id, network_id);
  return ports_.createPort(ctx, network_id, port_id, admin_status_enabled);
}

void Driver::deletePort(const Context & ctx,
                        const string & port_id,
                        optional<string> switch_uuid)
{
  LOG(INFO) << fmt::format("[{}] delete port {}", ctx.tenant_id, port_id);
  ports_.deleteNetworkPort(port_id, move(switch_uuid));
}

const DriverConfig & Driver::config() const { return config_; }

SwitchCapacityManager & Driver::switches() { return switches_; }
