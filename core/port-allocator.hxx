#ifndef SPANWIRE_CORE_PORT_ALLOCATOR_HXX
#define SPANWIRE_CORE_PORT_ALLOCATOR_HXX

#include <string>
#include "core/nvp.hxx"
#include "core/switch-manager.hxx"

namespace spanwire
{
  struct CreatedPort
  {
    std::string uuid;
    std::string lswitch;

    Json json() const;
  };

  class PortAllocator
  {
    public:
      PortAllocator(Connection &, SwitchCapacityManager &);

      CreatedPort createPort(const Context &,
                             const std::string & network_id,
                             const std::string & port_id,
                             bool admin_status_enabled = true);

      /*
       * Delete a port by the lport uuid handed out by createPort. Without a
       * switch uuid the hosting switch is looked up across all switches and
       * must be exactly one.
       */
      void deleteNetworkPort(const std::string & port_id,
                             optional<std::string> switch_uuid = nullopt);

    private:
      std::string hostOf(const std::string & port_id);

      Connection & conn_;
      SwitchCapacityManager & switches_;
  };
}

#endif
