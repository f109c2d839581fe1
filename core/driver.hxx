#ifndef SPANWIRE_CORE_DRIVER_HXX
#define SPANWIRE_CORE_DRIVER_HXX

#include <memory>
#include <string>
#include <vector>
#include "core/nvp.hxx"
#include "core/transport-zone.hxx"
#include "core/provider.hxx"
#include "core/network-details.hxx"
#include "core/switch-manager.hxx"
#include "core/port-allocator.hxx"

namespace spanwire
{
  // DriverConfig --------------------------------------------------------------
  struct DriverConfig
  {
    //controller endpoints in the order they are tried
    std::vector<std::string> controllers;
    std::string user, password;

    size_t max_ports_per_switch{0};
    size_t page_length{1000};
    size_t recv_window{65536};

    Json json() const;
    static DriverConfig fromJson(const Json &);
    static DriverConfig load(const std::string & path);
  };

  // Driver --------------------------------------------------------------------
  class Driver
  {
    public:
      Driver(DriverConfig,
             std::shared_ptr<Connection>,
             std::shared_ptr<NetworkDirectory> = std::make_shared<AnyNetwork>());

      Driver(const Driver &) = delete;
      Driver & operator= (const Driver &) = delete;

      //returns the uuid of the first switch of the network
      std::string createNetwork(const Context &,
                                const std::string & network_id,
                                const std::string & name,
                                const ProviderNetworkParams & = {});

      void deleteNetwork(const Context &, const std::string & network_id);

      CreatedPort createPort(const Context &,
                             const std::string & network_id,
                             const std::string & port_id,
                             bool admin_status_enabled = true);

      void deletePort(const Context &,
                      const std::string & port_id,
                      optional<std::string> switch_uuid = nullopt);

      const DriverConfig & config() const;
      SwitchCapacityManager & switches();

    private:
      DriverConfig config_;
      std::shared_ptr<Connection> conn_;
      std::shared_ptr<NetworkDirectory> directory_;
      TransportZoneResolver zones_;
      ProviderNetworkConfigurator configurator_;
      SwitchCapacityManager switches_;
      PortAllocator ports_;
  };
}

#endif
