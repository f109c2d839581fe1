/*
 * spreads a batch of ports for one network over the switches of a live
 * controller, then tears everything down again
 */

#include <memory>
#include <vector>
#include <fmt/format.h>
#include <gflags/gflags.h>
#include "spanwire.hxx"

using std::string;
using std::vector;
using std::make_shared;
using std::exception;
using namespace spanwire;

DEFINE_string(config, "/etc/spanwire/driver.json", "driver configuration");
DEFINE_string(tenant, "demo", "tenant the objects are created for");
DEFINE_string(network, "spanning-demo", "network id to create");
DEFINE_uint64(ports, 8, "number of ports to create");
DEFINE_string(phys_net, "", "transport zone uuid for a provider network");
DEFINE_string(net_type, "", "provider network type");
DEFINE_uint64(segment_id, 0, "vlan id for vlan provider networks");

int main(int argc, char **argv)
{
  Glog::init("spanning");

  gflags::SetUsageMessage("usage: spanning -config <file> -ports <n>");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  DriverConfig cfg = DriverConfig::load(FLAGS_config);

  auto conn = make_shared<HttpConnection>(
      cfg.controllers, cfg.user, cfg.password, cfg.recv_window);
  Driver driver{cfg, conn};

  Context ctx{FLAGS_tenant};

  ProviderNetworkParams p;
  if(!FLAGS_phys_net.empty()) p.phys_net = FLAGS_phys_net;
  if(!FLAGS_net_type.empty()) p.net_type = FLAGS_net_type;
  if(FLAGS_segment_id != 0) p.segment_id = FLAGS_segment_id;

  try
  {
    driver.createNetwork(ctx, FLAGS_network, FLAGS_network, p);

    vector<CreatedPort> ports;
    for(size_t i=0; i<FLAGS_ports; ++i)
    {
      string port_id = fmt::format("{}-port-{}", FLAGS_network, i);
      ports.push_back(driver.createPort(ctx, FLAGS_network, port_id));
      LOG(INFO) << ports.back().json();
    }

    for(const CreatedPort & cp : ports)
      driver.deletePort(ctx, cp.uuid, cp.lswitch);

    driver.deleteNetwork(ctx, FLAGS_network);
  }
  catch(ProviderNetworkError & e)
  {
    LOG(ERROR) << "invalid provider network: " << e.what();
    return 1;
  }
  catch(exception & e)
  {
    LOG(ERROR) << e.what();
    return 1;
  }

  return 0;
}
