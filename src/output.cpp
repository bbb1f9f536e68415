#include "pidbox/output.hpp"
#include <nlohmann/json.hpp>

namespace pidbox {

void render_text(std::ostream& out, const ResponseMap& responses) {
    for (const auto& [name, response] : responses) {
        out << name << ": OK " << response.status << "\n";
    }
    out << responses.size() << " nodes online.\n";
}

void render_json(std::ostream& out, const ResponseMap& responses) {
    if (responses.empty()) {
        out << "{}\n";
        return;
    }
    nlohmann::json document = nlohmann::json::object();
    for (const auto& [name, response] : responses) {
        document[name] = {{"ok", response.status}};
    }
    out << document.dump(2) << "\n";
}

int write_result(std::ostream& out, const ResponseMap& responses, OutputFormat format) {
    if (format == OutputFormat::Json) {
        render_json(out, responses);
    } else if (responses.empty()) {
        out << "Error: No nodes replied within time constraint.\n";
    } else {
        render_text(out, responses);
    }
    return responses.empty() ? 1 : 0;
}

} // namespace pidbox
