// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

/**
 * @file OutboxTokenDelivery.h
 * @brief Hands reset tokens to an external mailer through a spool directory
 */

#ifndef LOCKR_OUTBOX_TOKEN_DELIVERY_H
#define LOCKR_OUTBOX_TOKEN_DELIVERY_H

#include "../repositories/IResetTokenStore.h"
#include <string>

namespace Lockr {

/**
 * @brief Writes one owner-only key file per issued token
 *
 * The mail transport is a separate process that picks up files from the
 * outbox, sends them and deletes them. Each file is written atomically so
 * the mailer never sees a partial message:
 *
 * @code
 * [reset]
 * user-id=7f3a9c
 * email=alice@example.org
 * token=5d0c...
 * expires-at-ms=1760000000000
 * @endcode
 */
class OutboxTokenDelivery : public IResetTokenDelivery {
public:
    /**
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit OutboxTokenDelivery(std::string directory);

    [[nodiscard]] bool deliver(const UserAccount& account, std::string_view token,
                               TimePoint expires_at) override;

    [[nodiscard]] const std::string& directory() const noexcept { return m_directory; }

private:
    std::string m_directory;
};

}  // namespace Lockr

#endif  // LOCKR_OUTBOX_TOKEN_DELIVERY_H
