#include "rnm/common.hpp"

namespace rnm {
const char* to_string(PortDirection d) {
    switch (d) {
    case PortDirection::In: return "input";
    case PortDirection::Out: return "output";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, const Indent& i) {
    for (int k = 0; k < i.mN; ++k)
        os << ' ';
    return os;
}

void info(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "INFO: " << msg << "\n";
}
void warn(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "WARN: " << msg << "\n";
}
void error(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "ERROR: " << msg << "\n";
}
} // namespace rnm
