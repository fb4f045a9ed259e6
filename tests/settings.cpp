#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "swagcheck/exceptions.hpp"
#include "swagcheck/settings.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

int main() {
  using namespace swagcheck;
  // Defaults
  Settings d;
  assert(d.log_level == "INFO");
  assert(d.documents_dir == "firstbase_json");
  assert(d.preferred_namespace == "Standard");
  assert(d.root_definition == "TradeItem");
  assert(d.jobs == 1);
  assert(!d.strict_references);

  // JSON parse
  auto s = Settings::from_json(Json{{"log_level","debug"},{"verbose",true},{"json_output",true},
                                    {"schemas", Json::array({"product.json","catalogue.json"})},
                                    {"documents_dir","docs"},{"preferred_namespace","Local"},
                                    {"root_definition","Product"},{"strict_references",true},
                                    {"jobs",4}});
  assert(s.log_level == "DEBUG"); // uppercased
  assert(s.verbose && s.json_output && s.strict_references);
  assert(s.schemas.size() == 2 && s.schemas[1] == "catalogue.json");
  assert(s.documents_dir == "docs");
  assert(s.preferred_namespace == "Local");
  assert(s.root_definition == "Product");
  assert(s.jobs == 4);

  // Unspecified keys keep defaults
  auto partial = Settings::from_json(Json{{"verbose",true}});
  assert(partial.log_level == "INFO" && partial.jobs == 1 && partial.schemas.empty());

  // Env parse (set locally)
  set_env("SWAGCHECK_LOG_LEVEL","warn");
  set_env("SWAGCHECK_SCHEMAS","a.json:b.json");
  set_env("SWAGCHECK_DOCUMENTS_DIR","/tmp/docs");
  set_env("SWAGCHECK_JOBS","8");
  set_env("SWAGCHECK_STRICT","1");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN");
  assert(e.schemas.size() == 2 && e.schemas[0] == "a.json");
  assert(e.documents_dir == "/tmp/docs");
  assert(e.jobs == 8);
  assert(e.strict_references);

  // Level gating
  assert(!e.log_enabled("INFO"));
  assert(e.log_enabled("ERROR"));
  assert(Settings::level_rank("DEBUG") < Settings::level_rank("INFO"));

  set_env("SWAGCHECK_JOBS","many");
  bool threw = false;
  try { Settings::from_env(); } catch (const ConfigError&) { threw = true; }
  assert(threw);

  // Config file
  {
    std::ofstream out("swagcheck_settings_test.json");
    out << R"({"root_definition": "Pallet", "jobs": 2})";
  }
  auto f = Settings::from_file("swagcheck_settings_test.json");
  assert(f.root_definition == "Pallet" && f.jobs == 2);
  {
    std::ofstream out("swagcheck_settings_test.json");
    out << "{not json";
  }
  threw = false;
  try { Settings::from_file("swagcheck_settings_test.json"); } catch (const ConfigError&) { threw = true; }
  assert(threw);
  std::remove("swagcheck_settings_test.json");

  threw = false;
  try { Settings::from_file("does_not_exist_swagcheck.json"); } catch (const ConfigError&) { threw = true; }
  assert(threw);
  return 0;
}
