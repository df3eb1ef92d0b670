#include "worker_registry.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/path_utils.hpp"

namespace jobq::worker {

WorkerRegistry::WorkerRegistry(std::filesystem::path path) : path_(std::move(path)) {
}

jobq::registry::WorkerRegistry WorkerRegistry::Load() const {
  jobq::registry::WorkerRegistry registry;

  std::ifstream in(path_);
  if (!in) {
    return registry;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  const auto json = buffer.str();
  if (json.empty()) {
    return registry;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &registry, options);
  if (!status.ok()) {
    JOBQ_LOG_WARN("ignoring unreadable worker registry", {observability::StringField("path", path_.string()), observability::StringField("error", status.ToString())});
    return jobq::registry::WorkerRegistry{};
  }
  return registry;
}

void WorkerRegistry::Save(const jobq::registry::WorkerRegistry& registry) const {
  util::EnsureParentDirectory(path_);

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(registry, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize worker registry: " + status.ToString());
  }

  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to write " + tmp.string());
    }
    out << json;
    if (!out.flush()) {
      throw std::runtime_error("failed to write " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    throw std::runtime_error("failed to replace " + path_.string() + ": " + ec.message());
  }
}

} // namespace jobq::worker
