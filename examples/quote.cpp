// Ratevault - Quote Example
// Loads markets from JSON, deposits into each open vault and prints
// valuations now and after a simulated interval

#include <ratevault/clock.hpp>
#include <ratevault/config.hpp>
#include <ratevault/environment.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/wad.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace ratevault;

namespace {

const Address DEMO_ACCOUNT = addresses::from_id(0xD3);

void print_vault(const std::string& name, const Vault& vault) {
    const Market& market = vault.market();
    std::cout << name << " vault " << addresses::to_hex(vault.address()) << "\n"
              << "  stored rate:   " << wad::to_string(market.stored_exchange_rate()) << "\n"
              << "  current rate:  " << wad::to_string(vault.exchange_rate()) << "\n"
              << "  total assets:  " << wad::to_string(vault.total_assets()) << "\n"
              << "  share supply:  " << wad::to_string(vault.total_supply()) << "\n"
              << "  max deposit:   "
              << (vault.max_deposit(DEMO_ACCOUNT) == 0 ? "paused" : "unbounded") << "\n"
              << "  max withdraw:  " << wad::to_string(vault.max_withdraw(DEMO_ACCOUNT)) << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : "markets.json";
    Timestamp horizon = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 30 * 24 * 3600;

    try {
        Config config = Config::from_file(path);
        config.apply_logging();

        // Start at the most recent accrual so no market sees time run backwards
        Timestamp start = 0;
        for (const auto& market : config.markets) {
            start = std::max(start, market.accrual_timestamp);
        }
        ManualClock clock(start);
        Environment env(config, clock);

        Wad deposit = wad::from_int(1000);
        for (const auto& vault_config : config.vaults) {
            Vault& vault = env.vault(vault_config.asset);
            if (vault.max_deposit(DEMO_ACCOUNT) < deposit) continue;

            TokenLedger& token = env.token(vault_config.asset);
            token.mint(DEMO_ACCOUNT, deposit);
            token.approve(DEMO_ACCOUNT, vault.address(), deposit);
            Wad shares = vault.deposit(DEMO_ACCOUNT, deposit, DEMO_ACCOUNT);
            std::cout << "Deposited " << wad::to_string(deposit) << " " << token.symbol()
                      << " for " << wad::to_string(shares) << " shares\n";
        }

        auto print_all = [&] {
            for (const auto& vault_config : config.vaults) {
                print_vault(env.token(vault_config.asset).symbol(), env.vault(vault_config.asset));
            }
        };

        std::cout << "\n== At " << clock.now() << " ==\n";
        print_all();

        clock.advance(horizon);
        std::cout << "\n== After " << horizon << "s ==\n";
        print_all();
    } catch (const VaultError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
