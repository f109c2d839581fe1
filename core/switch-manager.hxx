#ifndef SPANWIRE_CORE_SWITCH_MANAGER_HXX
#define SPANWIRE_CORE_SWITCH_MANAGER_HXX

#include <string>
#include "core/nvp.hxx"
#include "core/provider.hxx"
#include "core/network-details.hxx"

namespace spanwire
{
  struct SelectedSwitch
  {
    std::string uuid;
    bool created{false};
  };

  /*
   * Spreads the ports of a network over as many logical switches as the
   * per-switch port bound requires. Placement is first fit: the first switch
   * with room is used, a new switch is only created once every existing one
   * is full. A bound of 0 means a single switch takes every port.
   */
  class SwitchCapacityManager
  {
    public:
      SwitchCapacityManager(Connection &,
                            NetworkDirectory &,
                            const ProviderNetworkConfigurator &,
                            size_t max_ports_per_switch,
                            size_t page_length = 0);

      size_t maxPortsPerSwitch() const;
      SwitchCapacityManager & maxPortsPerSwitch(size_t);

      SwitchCursor lswitchesForNetwork(const std::string & network_id) const;

      SelectedSwitch selectOrCreateSwitch(const Context &,
                                          const std::string & network_id);

      //eagerly create the first switch of a network
      std::string createNetwork(const Context &,
                                const std::string & network_id,
                                const std::string & name,
                                const ProviderNetworkParams &);

      //returns the number of switches removed
      size_t deleteNetwork(const std::string & network_id);

    private:
      std::string createSwitch(const Context &,
                               const std::string & network_id,
                               const std::string & name,
                               const ProviderNetworkParams &);

      bool hasRoom(const Json & lswitch) const;

      Connection & conn_;
      NetworkDirectory & directory_;
      const ProviderNetworkConfigurator & configurator_;
      NetworkDetailsExtractor extractor_;
      size_t max_ports_per_switch_;
      size_t page_length_;
  };
}

#endif
