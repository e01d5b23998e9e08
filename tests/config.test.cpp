#include <cstdio>
#include <fstream>
#include <string>

#include <NestSamp/Config.h>
#include "testing.h"

using namespace NEST;
using namespace std;

const string CONFIG_FILE = "config.test.json";

void write_file(const string & filename, const string & contents) {
    ofstream ofs(filename);
    ofs << contents;
}

void test_full_configuration() {
    write_file(CONFIG_FILE, R"({
        "parameters": [
            { "name": "mean", "short_name": "mu" },
            { "name": "phase", "short_name": "phi", "wrapped": true },
            { "name": "scale" }
        ],
        "shared": "./libmodel.so",
        "database_filename": "run.sqlite",
        "min_num_live_points": 250,
        "min_ess": 1000,
        "frac_remain": 0.05,
        "max_ncalls": 100000,
        "max_seconds": 2.5,
        "sampler": { "type": "SLICE", "nsteps": 6, "direction": "HARMONIC", "adaptive_nsteps": false,
                     "adapt_contraction_threshold": 4, "adapt_nsteps_factor": 2, "shrink_floor": 1e-6,
                     "min_scale": 1e-5, "history_size": 20, "max_reseeds": 10 },
        "num_threads": 4,
        "batch_size": 8,
        "seed": 12345,
        "log_interval": 100
    })");

    JsonConfig config(CONFIG_FILE);
    IS_TRUE(config.valid());

    ParameterSpace space;
    IS_TRUE(config.parse_parameters(space));
    IS_TRUE(space.size() == 3);
    IS_TRUE(space[0]->get_short_name() == "mu");
    IS_TRUE(space[1]->is_wrapped());
    IS_TRUE(not space[0]->is_wrapped());
    IS_TRUE(space[2]->get_short_name() == "scale"); // defaults to the name
    IS_TRUE(space.any_wrapped());

    NestOptions opts;
    IS_TRUE(config.parse_options(opts));
    IS_TRUE(opts.min_num_live_points == 250);
    IS_TRUE(opts.min_ess == 1000);
    IS_TRUE(opts.frac_remain == 0.05);
    IS_TRUE(opts.max_ncalls == 100000);
    IS_TRUE(opts.max_seconds == 2.5);
    IS_TRUE(opts.sampler == SLICE);
    IS_TRUE(opts.slice.nsteps == 6);
    IS_TRUE(opts.slice.direction == HARMONIC);
    IS_TRUE(not opts.slice.adaptive_nsteps);
    IS_TRUE(opts.slice.adapt_contraction_threshold == 4);
    IS_TRUE(opts.slice.adapt_nsteps_factor == 2);
    IS_TRUE(opts.slice.shrink_floor == 1e-6);
    IS_TRUE(opts.slice.min_scale == 1e-5);
    IS_TRUE(opts.slice.history_size == 20);
    IS_TRUE(opts.slice.max_reseeds == 10);
    IS_TRUE(opts.num_threads == 4);
    IS_TRUE(opts.batch_size == 8);
    IS_TRUE(opts.seed.has_value() and opts.seed.value() == 12345);
    IS_TRUE(opts.log_interval == 100);
    IS_TRUE(opts.max_iters == 0); // untouched default

    IS_TRUE(config.shared_object() == "./libmodel.so");
    IS_TRUE(config.database_filename() == "run.sqlite");

    remove(CONFIG_FILE.c_str());
}

void test_defaults() {
    Json::Value root;
    root["parameters"][0]["name"] = "x";
    JsonConfig config(root);
    IS_TRUE(config.valid());

    ParameterSpace space;
    IS_TRUE(config.parse_parameters(space));
    NestOptions opts;
    IS_TRUE(config.parse_options(opts));
    IS_TRUE(opts.min_num_live_points == 400);
    IS_TRUE(opts.sampler == AUTO);
    IS_TRUE(opts.slice.direction == MIXTURE);
    IS_TRUE(not opts.seed.has_value());
    IS_TRUE(config.shared_object().empty());

    root["shared"] = Json::Value(Json::arrayValue);
    IS_TRUE(JsonConfig(root).shared_object().empty());
}

void test_rejections() {
    {   // missing parameters
        Json::Value root(Json::objectValue);
        ParameterSpace space;
        IS_TRUE(not JsonConfig(root).parse_parameters(space));
    }
    {   // duplicate short names
        Json::Value root;
        root["parameters"][0]["name"] = "a";
        root["parameters"][0]["short_name"] = "x";
        root["parameters"][1]["name"] = "b";
        root["parameters"][1]["short_name"] = "x";
        ParameterSpace space;
        IS_TRUE(not JsonConfig(root).parse_parameters(space));
    }
    {   // unsanitized short name
        Json::Value root;
        root["parameters"][0]["name"] = "a b";
        ParameterSpace space;
        IS_TRUE(not JsonConfig(root).parse_parameters(space));
    }
    {   // unknown sampler
        Json::Value root;
        root["sampler"]["type"] = "ELLIPSOID";
        NestOptions opts;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
    }
    {   // unknown direction
        Json::Value root;
        root["sampler"]["direction"] = "DIAGONAL";
        NestOptions opts;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
    }
    {   // sampler type of the wrong kind
        Json::Value root;
        root["sampler"]["type"] = Json::Value(Json::objectValue);
        NestOptions opts;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
        root["sampler"]["type"] = Json::Value(Json::arrayValue);
        IS_TRUE(not JsonConfig(root).parse_options(opts));
        root["sampler"]["type"] = "SLICE";
        root["sampler"]["direction"] = 3;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
    }
    {   // non-numeric tuning constant
        Json::Value root;
        root["sampler"]["shrink_floor"] = "tiny";
        NestOptions opts;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
    }
    {   // short name of the wrong kind
        Json::Value root;
        root["parameters"][0]["name"] = "a";
        root["parameters"][0]["short_name"] = 7;
        ParameterSpace space;
        IS_TRUE(not JsonConfig(root).parse_parameters(space));
    }
    {   // out of range
        Json::Value root;
        root["frac_remain"] = 1.5;
        NestOptions opts;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
    }
    {   // wrong type
        Json::Value root;
        root["min_num_live_points"] = "many";
        NestOptions opts;
        IS_TRUE(not JsonConfig(root).parse_options(opts));
    }

    IS_TRUE(not JsonConfig(string("no_such_config.json")).valid());
    write_file(CONFIG_FILE, "{ \"parameters\": [ ");
    IS_TRUE(not JsonConfig(CONFIG_FILE).valid());
    remove(CONFIG_FILE.c_str());
}

void test_enum_names() {
    SAMPLER s;
    IS_TRUE(parse_sampler("AUTO", s) and s == AUTO);
    IS_TRUE(not parse_sampler("auto", s));
    DIRECTION d;
    IS_TRUE(parse_direction("DIFFERENTIAL", d) and d == DIFFERENTIAL);
    IS_TRUE(parse_direction("AXIS", d) and d == AXIS);
}

int main() {
    test_full_configuration();
    test_defaults();
    test_rejections();
    test_enum_names();
    return TEST_STATUS();
}
