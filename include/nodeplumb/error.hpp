#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nodeplumb {

// Every failure the library reports. Build-time kinds come out of
// NodeBuilder::build() and SubGraphBuilder::build(); MissingInput and Backend
// are per-invocation.
enum class ErrorKind : std::uint8_t {
    None,
    DuplicateNodeName,
    DuplicateBindingName,
    DuplicateBindingIndex,
    UnknownNodeReference,
    UnknownSlotReference,
    SlotKindMismatch,
    SlotAlreadyConnected,
    CyclicGraph,
    UnresolvedProvider,
    MissingShader,
    MissingEntryPoint,
    MissingDispatch,
    InvalidDispatch,
    MissingName,
    MissingInput,
    Backend,
};

[[nodiscard]] std::string_view errorKindName(ErrorKind kind);

// One finding inside an aggregated failure. `subject` names the node, slot or
// edge the finding is about, e.g. "producer.buf -> consumer.buf".
struct Issue {
    ErrorKind kind = ErrorKind::None;
    std::string subject;
    std::string message;
};

// Thin error type that carries what we tried, why it failed, and every issue
// the failing step collected. `kind` mirrors the first issue.
struct Error {
    std::string operation; // e.g. "build sub-graph"
    ErrorKind kind = ErrorKind::None;
    std::string message;   // human-readable summary
    std::vector<Issue> issues;

    [[nodiscard]] bool has(ErrorKind k) const;
    [[nodiscard]] std::size_t count(ErrorKind k) const;

    // Format as a single readable string (one line per issue).
    [[nodiscard]] std::string format() const;

    // Build an aggregated error from collected issues. Kind and summary are
    // taken from the first issue; `issues` must not be empty.
    [[nodiscard]] static Error fromIssues(std::string operation, std::vector<Issue> issues);
};

// Error unwrap hook used by Result<T>::orThrow().
// When NODEPLUMB_ENABLE_EXCEPTIONS=1, throws std::runtime_error.
// When NODEPLUMB_ENABLE_EXCEPTIONS=0, prints and aborts.
[[noreturn]] void throwError(const Error& e);

} // namespace nodeplumb
