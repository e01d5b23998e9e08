#ifndef NESTSAMP_NESTDB_H
#define NESTSAMP_NESTDB_H

#include <memory>
#include <string>
#include <vector>

#include <NestSamp/TypeDefs.h>
#include <NestSamp/Parameter.h>
#include <NestSamp/Result.h>

struct sqlite3;

// Storage of a finished run in an SQLite database:
//  - `run`: one row; logz, logzerr, ncall, niter, ess, information, status, stop_reason
//  - `sample`: one row per weighted posterior sample; serial, logl, weight, then one column per
//    parameter, named by its short name
//
// Methods report sqlite errors on stderr and return false.

namespace NEST {

class NestDB {

    public:
        NestDB(const std::string & path);
        ~NestDB();

        // @return true if the database could be opened
        bool is_open() const { return _db != nullptr; }

        // @return true if the `run` and `sample` tables exist
        bool is_setup();

        // create the tables for `space`; repeated invocations leave existing tables alone
        // @return true if storage is ready to receive a result
        bool setup(const ParameterSpace & space, const size_t verbose = 0);

        // replace any stored result with `res`, in a single transaction
        bool write_result(const Result & res, const size_t verbose = 0);

        // read the stored run summary and weighted samples into `res`
        // (parameter summaries are recomputed; diagnostics are not stored)
        bool read_result(Result & res);

    private:
        bool _execute(const std::string & sql);

        struct Closer { void operator()(sqlite3 * db) const; };
        std::unique_ptr<sqlite3, Closer> _db;
        const std::string _path;
};

}

#endif // NESTSAMP_NESTDB_H
