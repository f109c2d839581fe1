#ifndef SPANWIRE_CORE_NVP_HXX
#define SPANWIRE_CORE_NVP_HXX

/*
 * controller object model: request builders for logical switches, logical
 * ports and collection queries, and the connection interface the placement
 * logic talks to
 */

#include <string>
#include <vector>
#include <functional>
#include "core/util.hxx"

namespace spanwire
{
  // Tag -----------------------------------------------------------------------
  struct Tag
  {
    std::string scope, value;

    Json json() const;
    static Tag fromJson(const Json &);
  };

  bool operator== (const Tag &, const Tag &);

  // TransportZoneBinding ------------------------------------------------------
  struct TransportZoneBinding
  {
    std::string zone_uuid;
    std::string transport_type;
    optional<size_t> vlan_id;

    Json json() const;
    static TransportZoneBinding fromJson(const Json &);
  };

  bool operator== (const TransportZoneBinding &, const TransportZoneBinding &);
  bool operator!= (const TransportZoneBinding &, const TransportZoneBinding &);

  // LSwitch -------------------------------------------------------------------
  class LSwitch
  {
    public:
      std::string displayName() const;
      LSwitch & displayName(std::string);

      LSwitch & tag(std::string scope, std::string value);
      const std::vector<Tag> & tags() const;

      //bind the switch to a transport zone, the vlan id rides along as a
      //vlan translation binding
      LSwitch & transportZone(std::string zone_uuid,
                              std::string transport_type,
                              optional<size_t> vlan_id);
      const std::vector<TransportZoneBinding> & transportZones() const;

      Json json() const;

    private:
      std::string display_name_;
      std::vector<Tag> tags_;
      std::vector<TransportZoneBinding> zones_;
  };

  // LPort ---------------------------------------------------------------------
  class LPort
  {
    public:
      bool adminStatusEnabled() const;
      LPort & adminStatusEnabled(bool);

      std::string displayName() const;
      LPort & displayName(std::string);

      LPort & tag(std::string scope, std::string value);
      const std::vector<Tag> & tags() const;

      Json json() const;

    private:
      bool admin_status_enabled_{true};
      std::string display_name_;
      std::vector<Tag> tags_;
  };

  // Query ---------------------------------------------------------------------
  class Query
  {
    public:
      Query & field(std::string);
      Query & relation(std::string);
      Query & tag(std::string scope, std::string value);
      Query & uuid(std::string);
      Query & pageLength(size_t);
      Query & pageCursor(std::string);

      const std::vector<std::string> & fields() const;
      const std::vector<std::string> & relations() const;
      const std::vector<Tag> & tags() const;
      optional<std::string> uuid() const;
      optional<std::string> pageCursor() const;

      //the url query string, without the leading '?'
      std::string str() const;

    private:
      std::vector<std::string> fields_, relations_;
      std::vector<Tag> tags_;
      optional<std::string> uuid_, page_cursor_;
      size_t page_length_{0};
  };

  // Connection ----------------------------------------------------------------
  /*
   * The primitives of the controller api. Query results have the shape
   *   {"results": [...], "result_count": n, "page_cursor": "..."}
   * where page_cursor is only present when more pages are available.
   */
  class Connection
  {
    public:
      virtual ~Connection() = default;

      virtual Json createSwitch(const LSwitch &) = 0;
      virtual Json querySwitches(const Query &) = 0;
      virtual void deleteSwitch(const std::string & uuid) = 0;

      virtual Json createPort(const std::string & switch_uuid,
                              const LPort &) = 0;
      //queries ports across all switches
      virtual Json queryPorts(const Query &) = 0;
      virtual void deletePort(const std::string & switch_uuid,
                              const std::string & uuid) = 0;

      virtual Json queryTransportZones(const Query &) = 0;
  };

  // QueryCursor ---------------------------------------------------------------
  /*
   * A lazy, restartable view of a controller query. Nothing is fetched until
   * results() is called and every call re-runs the query, following page
   * cursors until the collection is exhausted or a cursor comes back twice.
   */
  class QueryCursor
  {
    public:
      using Fetch = std::function<Json(const Query &)>;

      QueryCursor(Fetch, Query);

      Json results() const;
      const Query & query() const;

    private:
      Fetch fetch_;
      Query query_;
  };

  using SwitchCursor = QueryCursor;

  // switch record helpers -----------------------------------------------------

  //the live port count reported by the LogicalSwitchStatus relation
  size_t lportCount(const Json & lswitch);

  //the uuid of the switch hosting a port record, via LogicalSwitchConfig
  std::string hostingSwitch(const Json & lport);

  // relation names
  namespace relation
  {
    static const std::string SwitchStatus{"LogicalSwitchStatus"};
    static const std::string SwitchConfig{"LogicalSwitchConfig"};
  }
}

#endif
