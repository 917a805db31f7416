// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

#include "VaultTypes.h"
#include <array>

namespace Lockr {

std::optional<EntryCategory> parse_category(std::string_view name) noexcept {
    static constexpr std::array<EntryCategory, 12> all = {
        EntryCategory::Other, EntryCategory::Login, EntryCategory::Card,
        EntryCategory::Note, EntryCategory::Wifi, EntryCategory::Email,
        EntryCategory::Social, EntryCategory::Banking, EntryCategory::Shopping,
        EntryCategory::Work, EntryCategory::Personal, EntryCategory::System
    };

    for (auto category : all) {
        if (to_string(category) == name) {
            return category;
        }
    }
    return std::nullopt;
}

} // namespace Lockr
