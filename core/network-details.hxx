#ifndef SPANWIRE_CORE_NETWORK_DETAILS_HXX
#define SPANWIRE_CORE_NETWORK_DETAILS_HXX

#include <string>
#include "core/nvp.hxx"
#include "core/provider.hxx"

namespace spanwire
{
  // NetworkDetails ------------------------------------------------------------
  /*
   * The provider placement of a network as recorded on its existing switches.
   * Fields are only present when they could be determined, a network with no
   * switches yet has no details at all. Once a switch was seen phys_net is
   * always reported, as null when that switch is not bound to a zone.
   */
  struct NetworkDetails
  {
    bool switch_seen{false};
    optional<std::string> network_name;
    optional<std::string> phys_net;
    optional<std::string> phys_type;
    optional<size_t> segment_id;

    bool empty() const;

    //the provider parameters that place a new switch next to the existing
    //ones
    ProviderNetworkParams providerParams() const;

    Json json() const;
  };

  // NetworkDirectory ----------------------------------------------------------
  /*
   * The network metadata store as seen from here: can the network record be
   * located at all.
   */
  class NetworkDirectory
  {
    public:
      virtual ~NetworkDirectory() = default;
      virtual bool located(const std::string & network_id) = 0;
  };

  //a directory that locates every network
  class AnyNetwork : public NetworkDirectory
  {
    public:
      bool located(const std::string &) override { return true; }
  };

  // NetworkDetailsExtractor ---------------------------------------------------
  class NetworkDetailsExtractor
  {
    public:
      /*
       * Derive details from a switch query result. Only the first switch and
       * its first transport zone are considered. Returns nothing when the
       * network itself could not be located.
       */
      optional<NetworkDetails>
      extract(const Json & switches, bool located = true) const;
  };
}

#endif
