#include "signature.hpp"
#include <boost/functional/hash.hpp>
#include <sstream>

namespace sbm {

std::string Signature::to_string() const {
    std::ostringstream oss;
    oss << "(";
    bool first = true;
    if (is_banded()) {
        oss << "'" << band << "'";
        first = false;
    }
    for (uint32_t s : symbols) {
        if (!first) {
            oss << ", ";
        }
        oss << s;
        first = false;
    }
    // One-element tuples keep their trailing comma
    if (width() == 1) {
        oss << ",";
    }
    oss << ")";
    return oss.str();
}

size_t SignatureHash::operator()(const Signature& sig) const {
    size_t seed = boost::hash_range(sig.symbols.begin(), sig.symbols.end());
    boost::hash_combine(seed, sig.band);
    return seed;
}

} // namespace sbm
