#include <NestSamp/Parameter.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

using std::string;
using std::vector;

namespace NEST {

bool valid_short_name(const string & ss) {
    if (ss.empty() or std::isdigit(static_cast<unsigned char>(ss[0]))) { return false; }
    return std::all_of(ss.begin(), ss.end(), [](const char c) {
        return std::isalnum(static_cast<unsigned char>(c)) or (c == '_');
    });
}

ParameterSpace::ParameterSpace(const ParameterVec & pars) {
    for (auto p : pars) { add_next_parameter(p); }
}

void ParameterSpace::add_next_parameter(const ParameterPtr p) {
    if (not valid_short_name(p->get_short_name())) {
        throw std::invalid_argument("parameter short name must be alphanumeric / underscore: '" + p->get_short_name() + "'");
    }
    for (auto existing : _pars) {
        if (existing->get_short_name() == p->get_short_name()) {
            throw std::invalid_argument("duplicate parameter short name: " + p->get_short_name());
        }
    }
    _pars.push_back(p);
}

vector<bool> ParameterSpace::wrapped() const {
    vector<bool> res;
    for (auto p : _pars) { res.push_back(p->is_wrapped()); }
    return res;
}

bool ParameterSpace::any_wrapped() const {
    return std::any_of(_pars.begin(), _pars.end(), [](const ParameterPtr & p) { return p->is_wrapped(); });
}

vector<string> ParameterSpace::short_names() const {
    vector<string> res;
    for (auto p : _pars) { res.push_back(p->get_short_name()); }
    return res;
}

} // namespace NEST
