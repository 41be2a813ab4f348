#include "erlangcore/types.hpp"

#include <algorithm>
#include <cctype>

namespace erlangcore {

ErlangVariant normalize_model(const std::string& name) {
    std::string m = name;
    std::transform(m.begin(), m.end(), m.begin(),
        [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (m == "b" || m.find("erlangb") != std::string::npos) return ErlangVariant::B;
    if (m == "a" || m.find("erlanga") != std::string::npos) return ErlangVariant::A;
    // Erlang X was folded into the abandonment model
    if (m == "x" || m.find("erlangx") != std::string::npos) return ErlangVariant::A;
    return ErlangVariant::C;
}

} // namespace erlangcore
