/**
 * Example SCFW verifier plugin
 *
 * Flags packages by name prefix: "evil-" is CRITICAL and "sketchy-" is a
 * WARNING. A target named "crash-verifier" makes verify() fail, which the
 * firewall records as an unavailable verifier.
 *
 * Build as a shared library and place it in $SCFW_HOME/verifiers:
 *
 *   c++ -std=c++17 -shared -fPIC -I include example_verifier.cpp \
 *       -o $SCFW_HOME/verifiers/example_verifier.so
 */

#include <scfw/verifier_plugin.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstring>
#include <string>

namespace {

char* copy_string(const std::string& s) {
    char* out = static_cast<char*>(std::malloc(s.size() + 1));
    if (out) std::memcpy(out, s.c_str(), s.size() + 1);
    return out;
}

bool has_prefix(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

int verify(const char* targets_json, char** findings_json) {
    nlohmann::json findings = nlohmann::json::array();

    try {
        auto targets = nlohmann::json::parse(targets_json);
        for (const auto& t : targets) {
            std::string name = t.at("name").get<std::string>();

            if (name == "crash-verifier") {
                *findings_json = copy_string("example verifier refused to run");
                return 1;
            }

            const char* severity = nullptr;
            if (has_prefix(name, "evil-")) {
                severity = "CRITICAL";
            } else if (has_prefix(name, "sketchy-")) {
                severity = "WARNING";
            }
            if (!severity) continue;

            findings.push_back({
                {"ecosystem", t.at("ecosystem")},
                {"name", name},
                {"version", t.at("version")},
                {"severity", severity},
                {"message", "Package " + name + " is on the example verifier's list"},
                {"detail", "EXAMPLE-1"},
            });
        }
    } catch (const nlohmann::json::exception& e) {
        *findings_json = copy_string(std::string("bad input: ") + e.what());
        return 1;
    }

    *findings_json = copy_string(findings.dump());
    return 0;
}

void free_string(char* s) {
    std::free(s);
}

const scfw_verifier_plugin kPlugin = {
    SCFW_VERIFIER_ABI_VERSION,
    "ExampleVerifier",
    &verify,
    &free_string,
};

} // namespace

extern "C" SCFW_PLUGIN_EXPORT const scfw_verifier_plugin* scfw_load_verifier(void) {
    return &kPlugin;
}
