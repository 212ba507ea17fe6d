#include "csv_splitter/plan_json.hpp"
#include "csv_splitter/errors.hpp"

#include <simdjson.h>
#include <fstream>
#include <sstream>

namespace cs {

std::vector<SplitDescriptor> parse_plan_json(std::string_view json) {
  std::vector<SplitDescriptor> out;
  simdjson::ondemand::parser parser;
  simdjson::padded_string padded(json);

  try {
    auto doc = parser.iterate(padded);
    simdjson::ondemand::array arr = doc["splits"].get_array();
    for (auto elem : arr) {
      simdjson::ondemand::object obj = elem.get_object();
      SplitDescriptor d;
      std::string_view path = obj["path"].get_string();
      d.path.assign(path.data(), path.size());
      d.offset = obj["offset"].get_uint64();
      d.length = obj["length"].get_uint64();
      out.push_back(std::move(d));
    }
  } catch (const simdjson::simdjson_error& e) {
    throw InputError(std::string("malformed plan: ") + e.what());
  }
  return out;
}

std::vector<SplitDescriptor> load_plan_json(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw IoError("cannot open plan file: " + path);
  std::ostringstream ss; ss << in.rdbuf();
  return parse_plan_json(ss.str());
}

}
