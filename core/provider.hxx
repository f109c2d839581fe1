#ifndef SPANWIRE_CORE_PROVIDER_HXX
#define SPANWIRE_CORE_PROVIDER_HXX

#include <string>
#include "core/nvp.hxx"
#include "core/errors.hxx"
#include "core/transport-zone.hxx"

namespace spanwire
{
  // NetType -------------------------------------------------------------------
  enum class NetType { Flat, Vlan, Gre, Stt, Local, Bridge };

  optional<NetType> parseNetType(const std::string &);
  std::string netTypeName(NetType);

  //the transport type a network type is carried on by the controller
  std::string transportType(NetType);

  // ProviderNetworkParams -----------------------------------------------------
  struct ProviderNetworkParams
  {
    optional<std::string> phys_net;
    //kept as given so unknown types can be reported as such
    optional<std::string> net_type;
    optional<size_t> segment_id;

    bool empty() const;
    Json json() const;
    static ProviderNetworkParams fromJson(const Json &);
  };

  // ProviderCheck -------------------------------------------------------------
  struct ProviderCheck
  {
    ProviderError error{ProviderError::None};
    std::string message;

    //the binding to apply, absent for non-provider networks and on error
    optional<TransportZoneBinding> binding;

    bool ok() const { return error == ProviderError::None; }
  };

  // ProviderNetworkConfigurator -----------------------------------------------
  class ProviderNetworkConfigurator
  {
    public:
      explicit ProviderNetworkConfigurator(const TransportZoneResolver &);

      /*
       * Decide whether a provider triple is legal. Static checks run first,
       * in order: parameter pairing, network type, segment id. Only then is
       * the physical network resolved against the controller.
       */
      ProviderCheck validate(const ProviderNetworkParams &) const;

      //validate and bind the switch to the resulting transport zone, throws
      //ProviderNetworkError on an illegal triple
      void configure(LSwitch &, const ProviderNetworkParams &) const;

      void configure(LSwitch &,
                     optional<std::string> phys_net,
                     optional<std::string> net_type,
                     optional<size_t> segment_id) const;

    private:
      const TransportZoneResolver & zones_;
  };
}

#endif
