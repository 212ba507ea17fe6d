#include "csv_splitter/plan_json.hpp"

#include <cstdio>
#include <sstream>

namespace cs {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

std::string PlanJsonWriter::to_json(const std::vector<SplitDescriptor>& splits) {
  std::ostringstream o;
  o << "{\"splits\":[";
  for (size_t i=0;i<splits.size();++i){
    if (i) o << ",";
    const auto& s = splits[i];
    o << "{\"path\":"; esc(o, s.path);
    o << ",\"offset\":" << s.offset
      << ",\"length\":" << s.length << "}";
  }
  o << "]}";
  return o.str();
}

std::string PlanJsonWriter::to_tsv(const std::vector<SplitDescriptor>& splits) {
  std::ostringstream o;
  for (const auto& s : splits) o << s.path << '\t' << s.offset << '\t' << s.length << '\n';
  return o.str();
}

}
