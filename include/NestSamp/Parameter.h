#ifndef NESTSAMP_PARAMETER_H
#define NESTSAMP_PARAMETER_H

#include <string>
#include <vector>
#include <memory>

// Design goals `Parameter`s:
//  - describe one coordinate of the model: its names and whether it is periodic
//  - has no state, and no knowledge of the sampler
//  - does not need to know about other parameters
//
// The prior itself is *not* a property of a Parameter: the user-supplied prior transform
// maps the whole unit cube to the physical space at once (see NestModel.h).

namespace NEST {

    class Parameter {
        public:
            Parameter(const std::string & s, const std::string & ss = "", const bool wrapped = false) :
            name(s), short_name(ss.empty() ? s : ss), _wrapped(wrapped) {}

            // get the parameter name (for printing, etc - can be whatever format)
            std::string get_name() const { return name; };
            // get the parameter short name (for storage, etc - should be short and sanitized: no spaces, symbols other than underscores)
            std::string get_short_name() const { return short_name; };

            // a wrapped (periodic) parameter moves modulo 1 on the unit cube, rather than rejecting at the boundary
            bool is_wrapped() const { return _wrapped; }

        private:
            const std::string name;
            const std::string short_name;
            const bool _wrapped;
    };

    typedef std::shared_ptr<const Parameter> ParameterPtr;
    typedef std::vector<ParameterPtr> ParameterVec;

    // checks that a short name is usable as a storage column: [A-Za-z_][A-Za-z0-9_]*
    bool valid_short_name(const std::string & ss);

    // The ordered set of model parameters; its size is the dimension of the unit cube
    // and of the physical space.
    class ParameterSpace {
        public:
            ParameterSpace() {}
            ParameterSpace(const ParameterVec & pars);

            // @throws std::invalid_argument on a duplicate or unsanitized short name
            void add_next_parameter(const ParameterPtr p);

            size_t size() const { return _pars.size(); }
            bool empty() const { return _pars.empty(); }

            const ParameterPtr & operator[](const size_t i) const { return _pars[i]; }
            const ParameterPtr & at(const size_t i) const { return _pars.at(i); }

            ParameterVec::const_iterator begin() const { return _pars.begin(); }
            ParameterVec::const_iterator end() const { return _pars.end(); }

            std::vector<bool> wrapped() const;
            bool any_wrapped() const;
            std::vector<std::string> short_names() const;

        private:
            ParameterVec _pars;
    };

}

#endif // NESTSAMP_PARAMETER_H
