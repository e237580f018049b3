#include <nodeplumb/error.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <utility>

namespace nodeplumb {

#ifndef NODEPLUMB_ENABLE_EXCEPTIONS
#define NODEPLUMB_ENABLE_EXCEPTIONS 1
#endif

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:                  return "None";
    case ErrorKind::DuplicateNodeName:     return "DuplicateNodeName";
    case ErrorKind::DuplicateBindingName:  return "DuplicateBindingName";
    case ErrorKind::DuplicateBindingIndex: return "DuplicateBindingIndex";
    case ErrorKind::UnknownNodeReference:  return "UnknownNodeReference";
    case ErrorKind::UnknownSlotReference:  return "UnknownSlotReference";
    case ErrorKind::SlotKindMismatch:      return "SlotKindMismatch";
    case ErrorKind::SlotAlreadyConnected:  return "SlotAlreadyConnected";
    case ErrorKind::CyclicGraph:           return "CyclicGraph";
    case ErrorKind::UnresolvedProvider:    return "UnresolvedProvider";
    case ErrorKind::MissingShader:         return "MissingShader";
    case ErrorKind::MissingEntryPoint:     return "MissingEntryPoint";
    case ErrorKind::MissingDispatch:       return "MissingDispatch";
    case ErrorKind::InvalidDispatch:       return "InvalidDispatch";
    case ErrorKind::MissingName:           return "MissingName";
    case ErrorKind::MissingInput:          return "MissingInput";
    case ErrorKind::Backend:               return "Backend";
    }
    return "Unknown";
}

bool Error::has(ErrorKind k) const {
    if (kind == k) return true;
    return std::any_of(issues.begin(), issues.end(),
                       [k](const Issue& i) { return i.kind == k; });
}

std::size_t Error::count(ErrorKind k) const {
    return static_cast<std::size_t>(std::count_if(
        issues.begin(), issues.end(), [k](const Issue& i) { return i.kind == k; }));
}

std::string Error::format() const {
    std::string out = "nodeplumb: " + operation + " failed";

    if (kind != ErrorKind::None) {
        out += " (";
        out += errorKindName(kind);
        out += ")";
    }

    if (!message.empty()) {
        out += ": " + message;
    }

    // The first issue is already the summary.
    for (std::size_t i = 1; i < issues.size(); ++i) {
        const auto& issue = issues[i];
        out += "\n  ";
        out += errorKindName(issue.kind);
        if (!issue.subject.empty()) {
            out += " [" + issue.subject + "]";
        }
        if (!issue.message.empty()) {
            out += ": " + issue.message;
        }
    }

    return out;
}

Error Error::fromIssues(std::string operation, std::vector<Issue> issues) {
    Error e;
    e.operation = std::move(operation);
    if (!issues.empty()) {
        const auto& first = issues.front();
        e.kind = first.kind;
        e.message = first.subject.empty() ? first.message
                                          : first.subject + ": " + first.message;
        if (issues.size() > 1) {
            e.message += " (+" + std::to_string(issues.size() - 1) + " more)";
        }
    }
    e.issues = std::move(issues);
    return e;
}

void throwError(const Error& e) {
#if NODEPLUMB_ENABLE_EXCEPTIONS
    throw std::runtime_error(e.format());
#else
    std::fprintf(stderr, "%s\n", e.format().c_str());
    std::abort();
#endif
}

} // namespace nodeplumb
