#ifndef NESTSAMP_NESTLOG_H
#define NESTSAMP_NESTLOG_H

#include <iostream>
#include <string>

#include <NestSamp/Parameter.h>
#include <NestSamp/NestOptions.h>
#include <NestSamp/Convergence.h>
#include <NestSamp/Result.h>

struct NestLog {

    static void run_header(
        const NEST::ParameterSpace & space, const NEST::NestOptions & opts,
        std::ostream & os = std::cerr
    );

    static void progress_header(std::ostream & os = std::cerr);
    static void progress(const NEST::ProgressRecord & rec, std::ostream & os = std::cerr);

    static void summary(const NEST::Result & res, std::ostream & os = std::cerr);

    static void stuck_proposal(
        const size_t nstuck, const size_t attempt, const float_type threshold,
        std::ostream & os = std::cerr
    );

    static void sampler_switch(
        const size_t iteration, const std::string & from, const std::string & to,
        const float_type efficiency,
        std::ostream & os = std::cerr
    );

    static void grow(
        const size_t iteration, const size_t added, const size_t nlive, const float_type logzerr,
        std::ostream & os = std::cerr
    );

    static void plateau(
        const size_t iteration, const float_type threshold, const size_t nlive,
        std::ostream & os = std::cerr
    );

    static void tie_recommendation(const size_t nties, std::ostream & os = std::cerr);

    static void order_test_warning(
        const size_t iteration, const float_type zscore, const size_t run_length,
        std::ostream & os = std::cerr
    );

    inline static const int WIDTH = 12;
    inline static const std::string double_bar = "=========================================================================================";

    private:
        NestLog() {};

};

#endif // NESTSAMP_NESTLOG_H
