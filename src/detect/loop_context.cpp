#include <scry/detect/loop_context.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace scry::detect {

namespace {

constexpr std::array<std::string_view, 4> kDataAccessMethods = {"get", "query", "execute",
                                                                "find"};
constexpr std::array<std::string_view, 4> kHandleSuffixes = {"db", "session", "model",
                                                             "objects"};

bool endsWithIgnoreCase(std::string_view text, std::string_view suffix) noexcept {
    if (suffix.size() > text.size())
        return false;
    auto tail = text.substr(text.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == b;
    });
}

} // namespace

bool isLoopKind(std::string_view nodeKind) noexcept {
    return nodeKind == "for_statement";
}

void AncestorStack::push(std::string_view nodeKind, std::string_view fieldName) {
    bool loopBody = fieldName == "body" && !frames_.empty() && isLoopKind(frames_.back().kind);
    frames_.push_back({nodeKind, loopBody});
    if (loopBody)
        ++loopDepth_;
}

void AncestorStack::pop() {
    if (frames_.empty()) {
        throw std::logic_error("AncestorStack::pop on empty stack");
    }
    if (frames_.back().loopBody)
        --loopDepth_;
    frames_.pop_back();
}

bool AncestorStack::contains(std::string_view nodeKind) const noexcept {
    return std::any_of(frames_.begin(), frames_.end(),
                       [&](const Frame& frame) { return frame.kind == nodeKind; });
}

bool AncestorStack::insideLoop() const noexcept {
    return loopDepth_ > 0;
}

bool isDataAccessCall(std::string_view receiver, std::string_view method) noexcept {
    if (receiver.empty())
        return false;
    if (std::find(kDataAccessMethods.begin(), kDataAccessMethods.end(), method) ==
        kDataAccessMethods.end())
        return false;
    return std::any_of(kHandleSuffixes.begin(), kHandleSuffixes.end(),
                       [&](std::string_view suffix) { return endsWithIgnoreCase(receiver, suffix); });
}

} // namespace scry::detect
