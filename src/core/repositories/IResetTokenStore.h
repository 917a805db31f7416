// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file IResetTokenStore.h
 * @brief Storage for hashed vault reset tokens
 */

#pragma once

#include "../VaultTypes.h"
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Lockr {

/**
 * @brief Interface for reset token persistence
 *
 * Tokens are addressed by the hex SHA-256 of the plain token. consume() is
 * the single point that enforces the single-use invariant and must be
 * atomic with respect to concurrent consume() calls for the same hash.
 */
class IResetTokenStore {
public:
    virtual ~IResetTokenStore() = default;

    /**
     * @brief Store a new token record
     * @return false if a record with the same hash already exists
     */
    [[nodiscard]] virtual bool insert(const ResetTokenRecord& record) = 0;

    [[nodiscard]] virtual std::optional<ResetTokenRecord> find(std::string_view token_hash) const = 0;

    /**
     * @brief Mark a usable token as used
     * @return The record as it was before consumption, or std::nullopt if
     *         the token is unknown, expired or already used
     */
    [[nodiscard]] virtual std::optional<ResetTokenRecord> consume(std::string_view token_hash,
                                                                  TimePoint now) = 0;

    /**
     * @brief Record how many entries the reset authorized by this token destroyed
     */
    virtual void record_wipe(std::string_view token_hash, size_t entries_wiped) = 0;

    /**
     * @brief Number of tokens issued to a user after since
     */
    [[nodiscard]] virtual size_t count_issued_since(std::string_view user_id, TimePoint since) const = 0;

    /**
     * @brief Drop records that are no longer usable and older than retain_since
     *
     * Records newer than retain_since are kept even when expired because
     * they still count against the per-user request budget.
     *
     * @return Number of records removed
     */
    virtual size_t purge(TimePoint now, TimePoint retain_since) = 0;

    /**
     * @brief Withdraw a token that never reached its holder
     * @return true if a record was removed
     */
    virtual bool remove(std::string_view token_hash) = 0;
};

/**
 * @brief Thread-safe in-memory token store
 */
class InMemoryResetTokenStore : public IResetTokenStore {
public:
    [[nodiscard]] bool insert(const ResetTokenRecord& record) override;
    [[nodiscard]] std::optional<ResetTokenRecord> find(std::string_view token_hash) const override;
    [[nodiscard]] std::optional<ResetTokenRecord> consume(std::string_view token_hash,
                                                          TimePoint now) override;
    void record_wipe(std::string_view token_hash, size_t entries_wiped) override;
    [[nodiscard]] size_t count_issued_since(std::string_view user_id, TimePoint since) const override;
    size_t purge(TimePoint now, TimePoint retain_since) override;
    bool remove(std::string_view token_hash) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, ResetTokenRecord, std::less<>> m_tokens;
};

/**
 * @brief Out-of-band channel that hands a reset token to the account holder
 *
 * The plain token only exists for the duration of this call. Implementations
 * must not log it. deliver() returns false when the token could not be
 * handed over; the issuing service then withdraws it.
 */
class IResetTokenDelivery {
public:
    virtual ~IResetTokenDelivery() = default;

    [[nodiscard]] virtual bool deliver(const UserAccount& account, std::string_view token,
                                       TimePoint expires_at) = 0;
};

}  // namespace Lockr
