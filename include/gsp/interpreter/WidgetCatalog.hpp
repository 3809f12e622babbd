#pragma once

#include <gsp/interpreter/StreamInterpreter.hpp>

#include <functional>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace GSP::Interpreter {

// Maps a node's kind tag to something the UI layer can build.
class WidgetCatalog {
public:
    virtual ~WidgetCatalog() = default;

    [[nodiscard]] virtual auto supports(std::string_view kind) const -> bool = 0;
};

class NamedWidgetCatalog final : public WidgetCatalog {
public:
    NamedWidgetCatalog() = default;
    NamedWidgetCatalog(std::initializer_list<std::string_view> kinds);

    void add(std::string_view kind);
    [[nodiscard]] auto supports(std::string_view kind) const -> bool override;
    [[nodiscard]] auto size() const -> std::size_t { return kinds_.size(); }

private:
    std::set<std::string, std::less<>> kinds_;
};

// Kinds used by the layout that the catalog cannot build, sorted, no duplicates.
[[nodiscard]] auto findUnsupportedKinds(ResolvedLayout const& layout, WidgetCatalog const& catalog)
    -> std::vector<std::string>;

} // namespace GSP::Interpreter
