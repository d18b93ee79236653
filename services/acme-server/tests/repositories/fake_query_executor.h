/**
 * @file fake_query_executor.h
 * @brief Recording IQueryExecutor for repository unit tests
 */

#pragma once

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>
#include "i_query_executor.h"

namespace acme_test {

/**
 * @brief Records every statement and answers from scripted queues
 *
 * Queries pop the next queued row set (empty array when none is queued),
 * commands pop the next affected-row count (0 when none is queued).
 */
class FakeQueryExecutor : public common::IQueryExecutor {
public:
    struct Call {
        std::string sql;
        std::vector<std::string> params;
    };

    std::vector<Call> calls;
    std::deque<Json::Value> queryResults;
    std::deque<int> commandResults;
    bool failNext = false;
    int transactions = 0;

    Json::Value executeQuery(const std::string& query, const std::vector<std::string>& params = {}) override {
        record(query, params);
        if (queryResults.empty()) return Json::Value(Json::arrayValue);
        Json::Value rows = queryResults.front();
        queryResults.pop_front();
        return rows;
    }

    int executeCommand(const std::string& query, const std::vector<std::string>& params) override {
        record(query, params);
        if (commandResults.empty()) return 0;
        int affected = commandResults.front();
        commandResults.pop_front();
        return affected;
    }

    Json::Value executeScalar(const std::string& query, const std::vector<std::string>& params = {}) override {
        Json::Value rows = executeQuery(query, params);
        if (rows.size() != 1 || rows[0].size() != 1) {
            throw std::runtime_error("Scalar query returned no single value");
        }
        return rows[0][rows[0].getMemberNames()[0]];
    }

    void runInTransaction(const std::function<void(IQueryExecutor&)>& work) override {
        ++transactions;
        work(*this);
    }

    std::string getDatabaseType() const override { return "fake"; }

    const Call& last() const { return calls.back(); }

private:
    void record(const std::string& query, const std::vector<std::string>& params) {
        calls.push_back({query, params});
        if (failNext) {
            failNext = false;
            throw std::runtime_error("connection lost");
        }
    }
};

} // namespace acme_test
