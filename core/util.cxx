#include <sstream>
#include <iomanip>
#include <cctype>
#include "util.hxx"

using std::string;
using std::vector;
using std::stringstream;
using std::setfill;
using std::setw;
using std::hex;
using std::uppercase;

using namespace spanwire;

string spanwire::joinStrings(const vector<string> & xs, string sep)
{
  string s;
  for(size_t i=0; i<xs.size(); ++i)
  {
    if(i > 0) s += sep;
    s += xs[i];
  }
  return s;
}

string spanwire::urlEncode(const string & s)
{
  stringstream ss;
  for(unsigned char c : s)
  {
    if(isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '*')
    {
      ss << c;
      continue;
    }
    ss << '%' << uppercase << setfill('0') << setw(2) << hex
       << static_cast<int>(c);
  }
  return ss.str();
}
