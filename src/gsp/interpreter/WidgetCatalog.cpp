#include <gsp/interpreter/WidgetCatalog.hpp>

#include <algorithm>

namespace GSP::Interpreter {

NamedWidgetCatalog::NamedWidgetCatalog(std::initializer_list<std::string_view> kinds) {
    for (auto kind : kinds) {
        add(kind);
    }
}

void NamedWidgetCatalog::add(std::string_view kind) {
    if (!kind.empty()) {
        kinds_.emplace(kind);
    }
}

auto NamedWidgetCatalog::supports(std::string_view kind) const -> bool {
    return kinds_.find(kind) != kinds_.end();
}

auto findUnsupportedKinds(ResolvedLayout const& layout, WidgetCatalog const& catalog)
    -> std::vector<std::string> {
    std::vector<std::string> unsupported;
    for (auto const& node : layout.nodes) {
        if (!catalog.supports(node.kind)) {
            unsupported.push_back(node.kind);
        }
    }
    std::sort(unsupported.begin(), unsupported.end());
    unsupported.erase(std::unique(unsupported.begin(), unsupported.end()), unsupported.end());
    return unsupported;
}

} // namespace GSP::Interpreter
