#ifndef NESTSAMP_NESTAPP_H
#define NESTSAMP_NESTAPP_H

#include <memory>
#include <optional>
#include <string>

#include <NestSamp/Parameter.h>
#include <NestSamp/NestModel.h>
#include <NestSamp/NestOptions.h>
#include <NestSamp/Result.h>

namespace NEST {

// The nested sampling verbs driven by `NEST::run` (see CLI.h), for a model loaded from the
// shared object named in a JSON configuration file.
class NestApp {
    public:
        bool parse(const std::string & config_file, const size_t verbose);
        bool sample(const std::optional<size_t> & seed, const std::optional<size_t> & max_ncalls, const size_t verbose);
        bool store(const size_t verbose);
        bool report(const size_t verbose);

        const std::optional<Result> & result() const { return _result; }

    private:
        ParameterSpace _space;
        NestOptions _opts;
        std::string _shared;
        std::string _database;
        std::unique_ptr<NestModel> _model;
        std::optional<Result> _result;
};

}

#endif // NESTSAMP_NESTAPP_H
