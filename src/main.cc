// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2025 tjdeveng

// lockr-vaultd - hosts the vault encryption core and its maintenance loop

#include <glibmm.h>
#include <glib-unix.h>
#include <csignal>
#include <iostream>
#include <memory>

#include "core/VaultCore.h"
#include "core/config/VaultConfig.h"
#include "core/crypto/PasswordGenerator.h"
#include "core/controllers/MaintenanceScheduler.h"
#include "core/io/OutboxTokenDelivery.h"
#include "core/repositories/FileEntryStore.h"
#include "core/repositories/IResetTokenStore.h"
#include "core/repositories/IUserDirectory.h"
#include "core/repositories/InMemoryEntryStore.h"
#include "utils/Log.h"

namespace {

/// Used when no outbox is configured: tokens are dropped and withdrawn, the request still succeeds
class DiscardingTokenDelivery : public Lockr::IResetTokenDelivery {
public:
    bool deliver(const Lockr::UserAccount& account, std::string_view /*token*/,
                 Lockr::TimePoint /*expires_at*/) override {
        Lockr::Log::warning("lockr-vaultd: No reset outbox configured, token for user {} discarded",
                            account.id);
        return false;
    }
};

gboolean on_quit_signal(gpointer data) {
    static_cast<Glib::MainLoop*>(data)->quit();
    return G_SOURCE_REMOVE;
}

}  // namespace

int main(int argc, char* argv[]) {
    Glib::init();

    std::string config_path;
    Glib::OptionEntry config_entry;
    config_entry.set_long_name("config");
    config_entry.set_short_name('c');
    config_entry.set_description("Configuration file");
    config_entry.set_arg_description("FILE");

    int generate_length = 0;
    Glib::OptionEntry generate_entry;
    generate_entry.set_long_name("generate-password");
    generate_entry.set_short_name('g');
    generate_entry.set_description("Print a random password of LENGTH characters and exit");
    generate_entry.set_arg_description("LENGTH");

    Glib::OptionGroup main_group("lockr", "Lockr vault daemon options");
    main_group.add_entry_filename(config_entry, config_path);
    main_group.add_entry(generate_entry, generate_length);

    Glib::OptionContext context("- vault encryption core daemon");
    context.set_main_group(main_group);

    try {
        context.parse(argc, argv);
    } catch (const Glib::Error& e) {
        std::cerr << e.what() << '\n';
        return 2;
    }

    if (generate_length != 0) {
        auto password = Lockr::PasswordGenerator::generate({.length = static_cast<size_t>(generate_length)});
        if (!password) {
            std::cerr << "Cannot generate a password of " << generate_length << " characters ("
                      << Lockr::PasswordGenerator::MIN_LENGTH << " to "
                      << Lockr::PasswordGenerator::MAX_LENGTH << " allowed)\n";
            return 2;
        }
        const auto strength = Lockr::PasswordGenerator::evaluate(*password);
        std::cout << *password << '\n'
                  << Lockr::to_string(strength.level) << ", "
                  << static_cast<int>(strength.entropy_bits) << " bits\n";
        return 0;
    }

    Lockr::VaultConfig config;
    if (!config_path.empty()) {
        auto loaded = Lockr::ConfigLoader::load_from_file(config_path);
        if (!loaded) {
            return 1;
        }
        config = std::move(*loaded);
    }
    Lockr::Log::set_level(config.log_level);

    std::unique_ptr<Lockr::IEntryStore> entries;
    if (config.storage_directory.empty()) {
        Lockr::Log::warning("lockr-vaultd: No storage directory configured, entries are not persisted");
        entries = std::make_unique<Lockr::InMemoryEntryStore>();
    } else {
        auto opened = Lockr::FileEntryStore::open(config.storage_directory);
        if (!opened) {
            Lockr::Log::error("lockr-vaultd: Cannot open entry store: {}", Lockr::to_string(opened.error()));
            return 1;
        }
        entries = std::move(*opened);
    }

    Lockr::InMemoryUserDirectory users;
    if (!config.users_file.empty()) {
        auto loaded = Lockr::ConfigLoader::load_users(config.users_file, users);
        if (!loaded) {
            return 1;
        }
        Lockr::Log::info("lockr-vaultd: Loaded {} accounts", *loaded);
    }

    std::unique_ptr<Lockr::IResetTokenDelivery> delivery;
    try {
        if (config.reset_outbox_directory.empty()) {
            delivery = std::make_unique<DiscardingTokenDelivery>();
        } else {
            delivery = std::make_unique<Lockr::OutboxTokenDelivery>(config.reset_outbox_directory);
        }
    } catch (const std::exception& e) {
        Lockr::Log::error("lockr-vaultd: {}", e.what());
        return 1;
    }

    Lockr::InMemoryResetTokenStore tokens;
    Lockr::VaultCore core(config, entries.get(), &users, &tokens, delivery.get());

    Lockr::MaintenanceScheduler scheduler(&core, static_cast<int>(config.sweep_interval.count()));
    scheduler.start();

    auto loop = Glib::MainLoop::create();
    g_unix_signal_add(SIGINT, on_quit_signal, loop.get());
    g_unix_signal_add(SIGTERM, on_quit_signal, loop.get());

    Lockr::Log::info("lockr-vaultd: Running");
    loop->run();

    scheduler.stop();
    Lockr::Log::info("lockr-vaultd: Shutting down, {} sessions discarded", core.sessions().session_count());
    return 0;
}
