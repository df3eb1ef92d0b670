#pragma once

#include <string>

namespace jobq::db::model {

struct ConfigRecord {
  std::string key;
  std::string value;
};

} // namespace jobq::db::model
