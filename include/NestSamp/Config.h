#ifndef NESTSAMP_CONFIG_H
#define NESTSAMP_CONFIG_H

#include <string>
#include <vector>
#include <json/json.h>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/Parameter.h>
#include <NestSamp/NestOptions.h>

namespace NEST {

// Source of the configuration-time inputs of a run. The parse methods report problems on stderr
// and return false, leaving the targets in an unspecified state.
struct Config {
    virtual ~Config() = default;
    virtual bool parse_parameters(ParameterSpace & space) const = 0;
    virtual bool parse_options(NestOptions & opts) const = 0;
    // path of the shared object providing `prior_transform` and `loglikelihood`
    virtual std::string shared_object() const = 0;
    virtual std::string database_filename() const = 0;
};

// Configuration from a JSON document, e.g.
//   { "parameters": [ { "name": "mean", "short_name": "mu", "wrapped": false } ],
//     "shared": "./libgaussian.so", "database_filename": "run.sqlite",
//     "min_num_live_points": 400, "sampler": { "type": "AUTO", "direction": "MIXTURE" } }
struct JsonConfig : public Config {
    JsonConfig(const std::string & filename);
    JsonConfig(const Json::Value & root);

    // false if the file could not be read or parsed
    bool valid() const { return _valid; }

    bool parse_parameters(ParameterSpace & space) const override;
    bool parse_options(NestOptions & opts) const override;
    std::string shared_object() const override;
    std::string database_filename() const override;

    private:
        Json::Value _root;
        bool _valid;
};

bool parse_sampler(const std::string & name, SAMPLER & sampler);
bool parse_direction(const std::string & name, DIRECTION & direction);

}

#endif // NESTSAMP_CONFIG_H
