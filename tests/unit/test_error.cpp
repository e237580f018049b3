#include <nodeplumb/error.hpp>

#include <cassert>
#include <string>
#include <vector>

using nodeplumb::Error;
using nodeplumb::ErrorKind;
using nodeplumb::Issue;

int main() {
    // Plain error with kind and message
    {
        Error e{"build sub-graph", ErrorKind::MissingName, "sub-graph needs a name"};
        std::string s = e.format();
        assert(s.find("build sub-graph") != std::string::npos);
        assert(s.find("MissingName") != std::string::npos);
        assert(s.find("sub-graph needs a name") != std::string::npos);
    }

    // No kind, no message
    {
        Error e{"record dispatch", ErrorKind::None, ""};
        std::string s = e.format();
        assert(s.find("record dispatch") != std::string::npos);
        assert(s.find("None") == std::string::npos);
    }

    // Aggregated issues: kind and summary come from the first one
    {
        std::vector<Issue> issues;
        issues.push_back({ErrorKind::UnknownNodeReference, "a -> ghost",
                          "target node 'ghost' is not in the graph"});
        issues.push_back({ErrorKind::UnknownSlotReference, "a.out -> b.nope",
                          "node 'b' has no input slot 'nope'"});
        issues.push_back({ErrorKind::UnknownNodeReference, "phantom -> b",
                          "source node 'phantom' is not in the graph"});

        Error e = Error::fromIssues("build sub-graph", issues);
        assert(e.operation == "build sub-graph");
        assert(e.kind == ErrorKind::UnknownNodeReference);
        assert(e.issues.size() == 3);
        assert(e.message.find("a -> ghost") != std::string::npos);
        assert(e.message.find("+2 more") != std::string::npos);

        assert(e.has(ErrorKind::UnknownSlotReference));
        assert(!e.has(ErrorKind::CyclicGraph));
        assert(e.count(ErrorKind::UnknownNodeReference) == 2);
        assert(e.count(ErrorKind::UnknownSlotReference) == 1);

        // One line per additional issue.
        std::string s = e.format();
        assert(s.find("a.out -> b.nope") != std::string::npos);
        assert(s.find("phantom -> b") != std::string::npos);
        assert(s.find('\n') != std::string::npos);
    }

    // Kind names
    {
        assert(nodeplumb::errorKindName(ErrorKind::CyclicGraph) == "CyclicGraph");
        assert(nodeplumb::errorKindName(ErrorKind::SlotKindMismatch) == "SlotKindMismatch");
        assert(nodeplumb::errorKindName(ErrorKind::Backend) == "Backend");
    }

    return 0;
}
