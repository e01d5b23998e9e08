#include <iostream>
#include <sstream>
#include <sqlite3.h>

#include <NestSamp/NestDB.h>

using std::string;
using std::stringstream;
using std::vector;
using std::cerr;
using std::endl;

const string RUN_TABLE    = "run";
const string SAMPLE_TABLE = "sample";

namespace {

struct StatementFinalizer { void operator()(sqlite3_stmt * stmt) const { sqlite3_finalize(stmt); } };
typedef std::unique_ptr<sqlite3_stmt, StatementFinalizer> StatementPtr;

StatementPtr prepare(sqlite3 * db, const string & sql) {
    sqlite3_stmt * stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        cerr << "Failed to prepare query: " << sqlite3_errmsg(db) << endl << sql << endl;
        sqlite3_finalize(stmt);
        return StatementPtr(nullptr);
    }
    return StatementPtr(stmt);
}

string column_string(sqlite3_stmt * stmt, const int col) {
    const unsigned char * text = sqlite3_column_text(stmt, col);
    return text ? string(reinterpret_cast<const char *>(text)) : string();
}

bool table_exists(sqlite3 * db, const string & table_name) {
    StatementPtr stmt = prepare(db, "SELECT COUNT(*) FROM sqlite_master WHERE type == 'table' AND name = ?;");
    if (not stmt) { return false; }
    sqlite3_bind_text(stmt.get(), 1, table_name.c_str(), -1, SQLITE_TRANSIENT);
    return (sqlite3_step(stmt.get()) == SQLITE_ROW) and (sqlite3_column_int(stmt.get(), 0) > 0);
}

}

namespace NEST {

void NestDB::Closer::operator()(sqlite3 * db) const { sqlite3_close(db); }

NestDB::NestDB(const string & path) : _path(path) {
    sqlite3 * db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        cerr << "Failed to open database " << path << ": " << sqlite3_errmsg(db) << endl;
        sqlite3_close(db);
        return;
    }
    _db.reset(db);
}

NestDB::~NestDB() = default;

bool NestDB::_execute(const string & sql) {
    if (not is_open()) { return false; }
    char * errmsg = nullptr;
    if (sqlite3_exec(_db.get(), sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        cerr << "Failed query: " << (errmsg ? errmsg : "unknown error") << endl << sql << endl;
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

bool NestDB::is_setup() {
    return is_open() and table_exists(_db.get(), RUN_TABLE) and table_exists(_db.get(), SAMPLE_TABLE);
}

bool NestDB::setup(const ParameterSpace & space, const size_t verbose) {
    if (not is_open()) { return false; }
    if (is_setup()) {
        if (verbose > 0) { cerr << "Database " << _path << " already set up" << endl; }
        return true;
    }

    stringstream ss;
    ss << "CREATE TABLE IF NOT EXISTS " << RUN_TABLE << " ( logz REAL, logzerr REAL, ncall INTEGER, niter INTEGER, "
       << "ess REAL, information REAL, status TEXT, stop_reason TEXT );\n";
    ss << "CREATE TABLE IF NOT EXISTS " << SAMPLE_TABLE << " ( serial INTEGER PRIMARY KEY, logl REAL, weight REAL";
    for (const auto & par : space) { ss << ", " << par->get_short_name() << " REAL"; }
    ss << " );";

    const bool ok = _execute(ss.str());
    if (ok and verbose > 0) { cerr << "Set up database " << _path << " for " << space.size() << " parameters" << endl; }
    return ok;
}

bool NestDB::write_result(const Result & res, const size_t verbose) {
    if (not is_setup()) {
        cerr << "Database " << _path << " is not set up" << endl;
        return false;
    }
    if (not _execute("BEGIN TRANSACTION;")) { return false; }

    bool ok = _execute("DELETE FROM " + RUN_TABLE + "; DELETE FROM " + SAMPLE_TABLE + ";");

    if (ok) {
        StatementPtr stmt = prepare(_db.get(), "INSERT INTO " + RUN_TABLE + " VALUES ( ?, ?, ?, ?, ?, ?, ?, ? );");
        ok = static_cast<bool>(stmt);
        if (ok) {
            stringstream status, reason;
            status << res.status;
            reason << res.stop_reason;
            sqlite3_bind_double(stmt.get(), 1, res.logz);
            sqlite3_bind_double(stmt.get(), 2, res.logzerr);
            sqlite3_bind_int64(stmt.get(), 3, res.ncall);
            sqlite3_bind_int64(stmt.get(), 4, res.niter);
            sqlite3_bind_double(stmt.get(), 5, res.ess);
            sqlite3_bind_double(stmt.get(), 6, res.information);
            sqlite3_bind_text(stmt.get(), 7, status.str().c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt.get(), 8, reason.str().c_str(), -1, SQLITE_TRANSIENT);
            ok = sqlite3_step(stmt.get()) == SQLITE_DONE;
        }
    }

    if (ok) {
        stringstream ss;
        ss << "INSERT INTO " << SAMPLE_TABLE << " VALUES ( ?, ?, ?";
        for (size_t j = 0; j < res.npar(); ++j) { ss << ", ?"; }
        ss << " );";
        StatementPtr stmt = prepare(_db.get(), ss.str());
        ok = static_cast<bool>(stmt);
        for (size_t i = 0; ok and i < res.size(); ++i) {
            sqlite3_bind_int64(stmt.get(), 1, i);
            sqlite3_bind_double(stmt.get(), 2, res.logl[i]);
            sqlite3_bind_double(stmt.get(), 3, res.weights[i]);
            for (size_t j = 0; j < res.npar(); ++j) { sqlite3_bind_double(stmt.get(), 4 + j, res.samples(i, j)); }
            ok = sqlite3_step(stmt.get()) == SQLITE_DONE;
            sqlite3_reset(stmt.get());
        }
    }

    if (not ok) {
        cerr << "Failed to write result to " << _path << ": " << sqlite3_errmsg(_db.get()) << endl;
        if (not _execute("ROLLBACK;")) { cerr << "Failed to roll back " << _path << endl; }
        return false;
    }
    ok = _execute("COMMIT;");
    if (ok and verbose > 0) { cerr << "Wrote " << res.size() << " samples to " << _path << endl; }
    return ok;
}

bool NestDB::read_result(Result & res) {
    if (not is_setup()) {
        cerr << "Database " << _path << " is not set up" << endl;
        return false;
    }

    StatementPtr run = prepare(_db.get(), "SELECT logz, logzerr, ncall, niter, ess, information, status, stop_reason FROM " + RUN_TABLE + ";");
    if (not run) { return false; }
    if (sqlite3_step(run.get()) != SQLITE_ROW) {
        cerr << "No run stored in " << _path << endl;
        return false;
    }
    res.logz = sqlite3_column_double(run.get(), 0);
    res.logzerr = sqlite3_column_double(run.get(), 1);
    res.ncall = sqlite3_column_int64(run.get(), 2);
    res.niter = sqlite3_column_int64(run.get(), 3);
    res.ess = sqlite3_column_double(run.get(), 4);
    res.information = sqlite3_column_double(run.get(), 5);
    const string status = column_string(run.get(), 6);
    res.status = (status == "CONVERGED") ? CONVERGED : BUDGET_EXHAUSTED;
    const string reason = column_string(run.get(), 7);
    const vector<string> reasons = { "NONE", "MAX_NCALLS", "MAX_ITERS", "DEADLINE", "CANCELLED", "MIN_ESS", "FRAC_REMAIN", "PLATEAU" };
    res.stop_reason = NONE;
    for (size_t r = 0; r < reasons.size(); ++r) { if (reason == reasons[r]) { res.stop_reason = static_cast<STOP_REASON>(r); } }

    StatementPtr count = prepare(_db.get(), "SELECT COUNT(*) FROM " + SAMPLE_TABLE + ";");
    if (not count or sqlite3_step(count.get()) != SQLITE_ROW) { return false; }
    const size_t nrow = sqlite3_column_int64(count.get(), 0);

    StatementPtr samples = prepare(_db.get(), "SELECT * FROM " + SAMPLE_TABLE + " ORDER BY serial;");
    if (not samples) { return false; }
    const size_t npar = sqlite3_column_count(samples.get()) - 3;

    res.names.clear();
    for (size_t j = 0; j < npar; ++j) { res.names.push_back(sqlite3_column_name(samples.get(), 3 + j)); }
    res.samples.resize(nrow, npar);
    res.logl.resize(nrow);
    res.weights.resize(nrow);
    res.logvol.resize(0);

    size_t i = 0;
    int rc;
    while (((rc = sqlite3_step(samples.get())) == SQLITE_ROW) and (i < nrow)) {
        res.logl[i] = sqlite3_column_double(samples.get(), 1);
        res.weights[i] = sqlite3_column_double(samples.get(), 2);
        for (size_t j = 0; j < npar; ++j) { res.samples(i, j) = sqlite3_column_double(samples.get(), 3 + j); }
        ++i;
    }
    if ((rc != SQLITE_DONE) or (i != nrow)) {
        cerr << "Failed to read samples from " << _path << ": " << sqlite3_errmsg(_db.get()) << endl;
        return false;
    }
    res.summarize();
    return true;
}

}
