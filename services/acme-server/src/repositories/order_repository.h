/**
 * @file order_repository.h
 * @brief PostgreSQL repository for orders
 */

#pragma once

#include "repository_interfaces.h"
#include "i_query_executor.h"

namespace repositories {

/**
 * @brief Order repository (acme_order table)
 *
 * Owns the order aggregate on creation: the order, its authorizations and
 * their challenges are inserted in one transaction.
 */
class OrderRepository : public IOrderRepository {
public:
    /**
     * @throws std::invalid_argument if queryExecutor is nullptr
     */
    explicit OrderRepository(common::IQueryExecutor* queryExecutor);
    ~OrderRepository() override = default;

    OrderRepository(const OrderRepository&) = delete;
    OrderRepository& operator=(const OrderRepository&) = delete;

    void createWithAuthorizations(
        const Order& order,
        const std::vector<Authorization>& authorizations,
        const std::vector<Challenge>& challenges) override;

    std::optional<Order> findById(const std::string& id) override;
    std::vector<std::string> findIdsByAccount(const std::string& accountId) override;
    bool startProcessing(const std::string& id, std::time_t now) override;
    bool markReadyIfAllAuthorizationsValid(const std::string& id) override;
    bool markInvalid(const std::string& id, OrderStatus from, const Json::Value& error) override;
    bool markValid(const std::string& id, const std::string& certificateSerial) override;
    int deleteExpired(std::time_t now) override;

private:
    common::IQueryExecutor* queryExecutor_;

    static Order rowToOrder(const Json::Value& row);
};

} // namespace repositories
