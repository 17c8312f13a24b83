#include "applogic/version.hpp"

#include <sstream>

#include "applogic/jsonlite.hpp"

namespace applogic {
namespace version {

VersionManifest current_manifest(const std::string& engine_semver) {
  VersionManifest m;
  m.engine_semver  = engine_semver.empty() ? "1.0.0" : engine_semver;
  m.hash_primitive = "blake3";
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"definition_format\":" << m.definition_format
    << ",\"engine_semver\":\"" << jsonlite::escape(m.engine_semver) << "\""
    << ",\"event_log\":" << m.event_log
    << ",\"expression_grammar\":" << m.expression_grammar
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"hash_primitive\":\"" << jsonlite::escape(m.hash_primitive) << "\""
    << ",\"state_format\":" << m.state_format
    << "}";
  return o.str();
}

CompatibilityResult check_definition_format(uint32_t declared_version) {
  CompatibilityResult r;
  if (declared_version == 0 || declared_version > DEFINITION_FORMAT_VERSION) {
    r.ok          = false;
    r.error_code  = "definition_format_unsupported";
    r.description = "definition format_version " + std::to_string(declared_version) +
                    " is not supported (engine reads 1.." +
                    std::to_string(DEFINITION_FORMAT_VERSION) + ")";
  }
  return r;
}

}  // namespace version
}  // namespace applogic
