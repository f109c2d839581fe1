#include <set>
#include <fmt/format.h>
#include "core/nvp.hxx"

using std::string;
using std::vector;
using std::move;

using namespace spanwire;

// Tag -------------------------------------------------------------------------

Json Tag::json() const
{
  Json j;
  j["scope"] = scope;
  j["tag"] = value;
  return j;
}

Tag Tag::fromJson(const Json & j)
{
  Tag t;
  t.scope = extract(j, "scope", "tag").get<string>();
  t.value = extract(j, "tag", "tag").get<string>();
  return t;
}

bool spanwire::operator== (const Tag & a, const Tag & b)
{
  return a.scope == b.scope && a.value == b.value;
}

// TransportZoneBinding --------------------------------------------------------

Json TransportZoneBinding::json() const
{
  Json j;
  j["zone_uuid"] = zone_uuid;
  j["transport_type"] = transport_type;
  if(vlan_id)
  {
    Json t;
    t["transport"] = *vlan_id;
    j["binding_config"]["vlan_translation"] = Json::array({t});
  }
  return j;
}

TransportZoneBinding TransportZoneBinding::fromJson(const Json & j)
{
  TransportZoneBinding b;
  b.zone_uuid = extract(j, "zone_uuid", "transport-zone").get<string>();
  b.transport_type =
    extract(j, "transport_type", "transport-zone").get<string>();

  auto binding = maybeExtract(j, "binding_config");
  if(binding)
  {
    auto vt = maybeExtract(*binding, "vlan_translation");
    if(vt && vt->is_array() && !vt->empty())
    {
      b.vlan_id =
        extract(vt->at(0), "transport", "vlan-translation").get<size_t>();
    }
  }
  return b;
}

bool spanwire::operator== (const TransportZoneBinding & a,
                           const TransportZoneBinding & b)
{
  return
    a.zone_uuid == b.zone_uuid &&
    a.transport_type == b.transport_type &&
    a.vlan_id == b.vlan_id;
}

bool spanwire::operator!= (const TransportZoneBinding & a,
                           const TransportZoneBinding & b)
{
  return !(a == b);
}

static Json tagsJson(const vector<Tag> & tags)
{
  Json js = Json::array();
  for(const Tag & t : tags) js.push_back(t.json());
  return js;
}

// LSwitch ---------------------------------------------------------------------

string LSwitch::displayName() const { return display_name_; }
LSwitch & LSwitch::displayName(string name)
{
  display_name_ = move(name);
  return *this;
}

LSwitch & LSwitch::tag(string scope, string value)
{
  tags_.push_back(Tag{move(scope), move(value)});
  return *this;
}

const vector<Tag> & LSwitch::tags() const { return tags_; }

LSwitch & LSwitch::transportZone(string zone_uuid,
                                 string transport_type,
                                 optional<size_t> vlan_id)
{
  zones_.push_back(
    TransportZoneBinding{move(zone_uuid), move(transport_type), vlan_id});
  return *this;
}

const vector<TransportZoneBinding> & LSwitch::transportZones() const
{
  return zones_;
}

Json LSwitch::json() const
{
  Json j;
  j["display_name"] = display_name_;
  j["tags"] = tagsJson(tags_);

  Json zs = Json::array();
  for(const auto & z : zones_) zs.push_back(z.json());
  j["transport_zones"] = zs;
  return j;
}

// LPort -----------------------------------------------------------------------

bool LPort::adminStatusEnabled() const { return admin_status_enabled_; }
LPort & LPort::adminStatusEnabled(bool enabled)
{
  admin_status_enabled_ = enabled;
  return *this;
}

string LPort::displayName() const { return display_name_; }
LPort & LPort::displayName(string name)
{
  display_name_ = move(name);
  return *this;
}

LPort & LPort::tag(string scope, string value)
{
  tags_.push_back(Tag{move(scope), move(value)});
  return *this;
}

const vector<Tag> & LPort::tags() const { return tags_; }

Json LPort::json() const
{
  Json j;
  j["admin_status_enabled"] = admin_status_enabled_;
  if(!display_name_.empty()) j["display_name"] = display_name_;
  j["tags"] = tagsJson(tags_);
  return j;
}

// Query -----------------------------------------------------------------------

Query & Query::field(string f)
{
  fields_.push_back(move(f));
  return *this;
}

Query & Query::relation(string r)
{
  relations_.push_back(move(r));
  return *this;
}

Query & Query::tag(string scope, string value)
{
  tags_.push_back(Tag{move(scope), move(value)});
  return *this;
}

Query & Query::uuid(string u)
{
  uuid_ = move(u);
  return *this;
}

Query & Query::pageLength(size_t n)
{
  page_length_ = n;
  return *this;
}

Query & Query::pageCursor(string c)
{
  page_cursor_ = move(c);
  return *this;
}

const vector<string> & Query::fields() const { return fields_; }
const vector<string> & Query::relations() const { return relations_; }
const vector<Tag> & Query::tags() const { return tags_; }
optional<string> Query::uuid() const { return uuid_; }
optional<string> Query::pageCursor() const { return page_cursor_; }

string Query::str() const
{
  vector<string> params;
  if(!fields_.empty())
    params.push_back("fields=" + joinStrings(fields_, ","));

  for(const string & r : relations_)
    params.push_back("relations=" + urlEncode(r));

  for(const Tag & t : tags_)
  {
    params.push_back(fmt::format("tag={}&tag_scope={}",
                                 urlEncode(t.value),
                                 urlEncode(t.scope)));
  }

  if(uuid_) params.push_back("uuid=" + urlEncode(*uuid_));
  if(page_length_ > 0)
    params.push_back(fmt::format("_page_length={}", page_length_));
  if(page_cursor_) params.push_back("_page_cursor=" + urlEncode(*page_cursor_));

  return joinStrings(params, "&");
}

// QueryCursor -----------------------------------------------------------------

QueryCursor::QueryCursor(Fetch fetch, Query query)
  : fetch_{move(fetch)},
    query_{move(query)}
{}

const Query & QueryCursor::query() const { return query_; }

Json QueryCursor::results() const
{
  Json all = Json::array();
  std::set<string> followed;
  Query q = query_;
  for(;;)
  {
    Json page = fetch_(q);
    for(const Json & r : extract(page, "results", "query"))
      all.push_back(r);

    auto cursor = maybeExtract(page, "page_cursor");
    if(!cursor || !cursor->is_string() || cursor->get<string>().empty())
      break;

    string next = cursor->get<string>();
    if(!followed.insert(next).second)
    {
      LOG(WARNING) << "page cursor " << next << " repeated, stopping";
      break;
    }

    VLOG(1) << "following page cursor " << next;
    q.pageCursor(next);
  }

  Json j;
  j["result_count"] = all.size();
  j["results"] = all;
  return j;
}

// switch record helpers -------------------------------------------------------

size_t spanwire::lportCount(const Json & lswitch)
{
  Json rel = extract(lswitch, "_relations", "lswitch");
  Json status = extract(rel, relation::SwitchStatus, "lswitch");
  return extract(status, "lport_count", "lswitch").get<size_t>();
}

string spanwire::hostingSwitch(const Json & lport)
{
  Json rel = extract(lport, "_relations", "lport");
  Json config = extract(rel, relation::SwitchConfig, "lport");
  return extract(config, "uuid", "lport").get<string>();
}
