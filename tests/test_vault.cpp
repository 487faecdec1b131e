// Ratevault - Market Vault Tests

#include <catch2/catch.hpp>
#include <ratevault/errors.hpp>
#include <ratevault/log.hpp>
#include <ratevault/simulated_market.hpp>
#include <ratevault/vault.hpp>
#include <ratevault/wad.hpp>

#include <memory>
#include <optional>

using namespace ratevault;

namespace {

const Address ASSET = addresses::from_id(0xA55E7);
const Address MARKET = addresses::from_id(0xC0DE);
const Address VAULT = addresses::from_id(0x7A17);
const Address RECIPIENT = addresses::from_id(0xFEE);
const Address ALICE = addresses::from_id(1);
const Address BOB = addresses::from_id(2);
const Address BORROWER = addresses::from_id(3);

struct VaultFixture {
    ManualClock clock{1700000000};
    TokenLedger asset{ASSET, "DAI"};
    std::shared_ptr<SimulatedMarket> market;
    std::unique_ptr<Vault> vault;

    explicit VaultFixture(const Wad& initial_rate = WAD) {
        market = std::make_shared<SimulatedMarket>(
            MARKET, asset, clock, std::make_shared<ConstantRateModel>(Wad(1000000000000ULL)),
            initial_rate, WAD / 10);
        vault = std::make_unique<Vault>(VAULT, asset, market, clock, RECIPIENT);

        fund(ALICE, wad::from_int(1000));
        fund(BOB, wad::from_int(1000));
    }

    void fund(const Address& who, const Wad& amount) {
        asset.mint(who, amount);
        asset.approve(who, VAULT, MAX_WAD);
    }
};

// Pays a fixed amount of its token to whoever claims
class FixedRewards : public RewardsDistributor {
public:
    FixedRewards(TokenLedger& token, const Wad& amount) : token_(token), amount_(amount) {}

    void claim_rewards(const Address& holder) override {
        claimed_by = holder;
        token_.mint(holder, amount_);
    }

    std::optional<Address> claimed_by;

private:
    TokenLedger& token_;
    Wad amount_;
};

// Market whose mint pulls the approved underlying and can then report failure
class PullingMarket : public Market {
public:
    PullingMarket(const Address& address, TokenLedger& underlying, uint64_t mint_code)
        : address_(address), underlying_(underlying), mint_code_(mint_code) {}

    const Address& address() const override { return address_; }
    const Address& underlying() const override { return underlying_.address(); }

    Timestamp accrual_timestamp() const override { return accrual_timestamp_; }
    Wad stored_exchange_rate() const override { return WAD; }
    Wad cash() const override { return underlying_.balance_of(address_); }
    Wad total_borrows() const override { return 0; }
    Wad total_reserves() const override { return 0; }
    Wad total_supply() const override { return supply_; }
    Wad reserve_factor() const override { return 0; }
    Wad initial_exchange_rate() const override { return WAD; }
    const InterestRateModel& interest_rate_model() const override { return model_; }
    bool mint_paused() const override { return false; }

    Wad balance_of(const Address& account) const override {
        return account == holder_ ? supply_ : Wad(0);
    }

    uint64_t mint(const Address& minter, const Wad& amount) override {
        underlying_.transfer_from(address_, minter, address_, amount);
        if (mint_code_ != status::OK) return mint_code_;
        holder_ = minter;
        supply_ += amount;
        return status::OK;
    }

    uint64_t redeem_underlying(const Address&, const Wad&) override {
        return status::TOKEN_INSUFFICIENT_CASH;
    }

    // Stale accrual plus an out-of-range model makes any later valuation throw
    void go_stale(Timestamp accrual_timestamp) {
        accrual_timestamp_ = accrual_timestamp;
        model_ = ConstantRateModel(Wad(6000000000000ULL));
    }

private:
    Address address_;
    TokenLedger& underlying_;
    uint64_t mint_code_;
    Timestamp accrual_timestamp_ = 1700000000;
    ConstantRateModel model_{Wad(0)};
    Address holder_{};
    Wad supply_;
};

}  // namespace

TEST_CASE("Deposit and redeem at a 1:1 initial rate", "[vault]") {
    VaultFixture f;
    Wad hundred = wad::from_int(100);

    SECTION("First deposit mints shares 1:1") {
        REQUIRE(f.vault->preview_deposit(hundred) == hundred);
        REQUIRE(f.vault->deposit(ALICE, hundred, ALICE) == hundred);

        REQUIRE(f.vault->balance_of(ALICE) == hundred);
        REQUIRE(f.vault->total_supply() == hundred);
        REQUIRE(f.vault->total_assets() == hundred);
        REQUIRE(f.asset.balance_of(ALICE) == wad::from_int(900));
        REQUIRE(f.asset.balance_of(MARKET) == hundred);
        REQUIRE(f.asset.balance_of(VAULT) == 0);
        REQUIRE(f.market->balance_of(VAULT) == hundred);
        // Approval to the market was fully consumed
        REQUIRE(f.asset.allowance(VAULT, MARKET) == 0);
    }

    SECTION("Deposit to another receiver") {
        f.vault->deposit(ALICE, hundred, BOB);
        REQUIRE(f.vault->balance_of(BOB) == hundred);
        REQUIRE(f.vault->balance_of(ALICE) == 0);
    }

    SECTION("Redeem returns the underlying") {
        f.vault->deposit(ALICE, hundred, ALICE);
        REQUIRE(f.vault->redeem(ALICE, hundred, ALICE, ALICE) == hundred);

        REQUIRE(f.vault->total_supply() == 0);
        REQUIRE(f.asset.balance_of(ALICE) == wad::from_int(1000));
        REQUIRE(f.market->balance_of(VAULT) == 0);
    }

    SECTION("Mint pulls the previewed assets") {
        Wad assets = f.vault->mint(ALICE, hundred, ALICE);
        REQUIRE(assets == hundred);
        REQUIRE(f.vault->balance_of(ALICE) == hundred);
    }

    SECTION("Withdraw burns the previewed shares") {
        f.vault->deposit(ALICE, hundred, ALICE);
        Wad shares = f.vault->withdraw(ALICE, wad::from_int(40), BOB, ALICE);
        REQUIRE(shares == wad::from_int(40));
        REQUIRE(f.vault->balance_of(ALICE) == wad::from_int(60));
        REQUIRE(f.asset.balance_of(BOB) == wad::from_int(1040));
    }
}

TEST_CASE("Interest accrues to share holders", "[vault]") {
    VaultFixture f(WAD / 50);  // 1 underlying buys 50 principal
    Wad thousand = wad::from_int(1000);

    f.vault->deposit(ALICE, thousand, ALICE);
    REQUIRE(f.market->balance_of(VAULT) == wad::from_int(50000));
    REQUIRE(f.vault->total_assets() == thousand);

    REQUIRE(f.market->borrow(BORROWER, wad::from_int(500)) == status::OK);
    Wad assets_before = f.vault->total_assets();

    f.clock.advance(100);

    SECTION("Valuation grows without an on-chain accrual") {
        Wad after = f.vault->total_assets();
        REQUIRE(after > assets_before);
        REQUIRE(f.market->accrual_timestamp() == 1700000000);
        // 0.05 interest, 10% to reserves
        REQUIRE(after == thousand + wad::parse_units("0.045"));
    }

    SECTION("Later depositors get fewer shares") {
        Wad hundred = wad::from_int(100);
        Wad shares = f.vault->preview_deposit(hundred);
        REQUIRE(shares < hundred);
        REQUIRE(f.vault->deposit(BOB, hundred, BOB) == shares);
    }

    SECTION("Previews round against the caller") {
        Wad assets = wad::from_int(10);
        REQUIRE(f.vault->preview_withdraw(assets) >= f.vault->convert_to_shares(assets));
        REQUIRE(f.vault->preview_mint(assets) >= f.vault->convert_to_assets(assets));
        REQUIRE(f.vault->preview_redeem(assets) == f.vault->convert_to_assets(assets));
    }

    SECTION("Withdrawals are capped by market cash") {
        // 1000 supplied, 500 lent out
        REQUIRE(f.vault->max_withdraw(ALICE) == wad::from_int(500));
        REQUIRE(f.vault->max_redeem(ALICE) <= f.vault->balance_of(ALICE));
        REQUIRE(f.vault->max_withdraw(BOB) == 0);

        REQUIRE_THROWS_AS(f.vault->withdraw(ALICE, wad::from_int(501), ALICE, ALICE),
                          LimitExceeded);
        f.vault->withdraw(ALICE, wad::from_int(500), ALICE, ALICE);
        REQUIRE(f.market->cash() == 0);
        REQUIRE(f.vault->max_withdraw(ALICE) == 0);
    }
}

TEST_CASE("Deposits respect the market pause", "[vault]") {
    VaultFixture f;
    f.market->set_mint_paused(true);

    REQUIRE(f.vault->max_deposit(ALICE) == 0);
    REQUIRE(f.vault->max_mint(ALICE) == 0);
    REQUIRE_THROWS_AS(f.vault->deposit(ALICE, WAD, ALICE), LimitExceeded);
    REQUIRE_THROWS_AS(f.vault->mint(ALICE, WAD, ALICE), LimitExceeded);

    f.market->set_mint_paused(false);
    REQUIRE(f.vault->max_deposit(ALICE) == MAX_WAD);
    REQUIRE(f.vault->max_mint(ALICE) == MAX_WAD);
}

TEST_CASE("Zero amounts are rejected", "[vault]") {
    VaultFixture f;
    REQUIRE_THROWS_AS(f.vault->deposit(ALICE, Wad(0), ALICE), ZeroAmount);
    REQUIRE_THROWS_AS(f.vault->mint(ALICE, Wad(0), ALICE), ZeroAmount);

    f.vault->deposit(ALICE, wad::from_int(10), ALICE);
    REQUIRE_THROWS_AS(f.vault->withdraw(ALICE, Wad(0), ALICE, ALICE), ZeroAmount);
    REQUIRE_THROWS_AS(f.vault->redeem(ALICE, Wad(0), ALICE, ALICE), ZeroAmount);
}

TEST_CASE("Market failures roll the vault back", "[vault]") {
    VaultFixture f;
    Wad hundred = wad::from_int(100);

    SECTION("Failed mint leaves no transfer and no shares") {
        f.market->fail_next_mint(status::TOKEN_INSUFFICIENT_BALANCE);
        try {
            f.vault->deposit(ALICE, hundred, ALICE);
            FAIL("deposit should have thrown");
        } catch (const MarketOperationFailed& e) {
            REQUIRE(e.code() == status::TOKEN_INSUFFICIENT_BALANCE);
        }

        REQUIRE(f.asset.balance_of(ALICE) == wad::from_int(1000));
        REQUIRE(f.asset.balance_of(VAULT) == 0);
        REQUIRE(f.vault->total_supply() == 0);
        REQUIRE(f.asset.allowance(VAULT, MARKET) == 0);
        REQUIRE(f.asset.allowance(ALICE, VAULT) == MAX_WAD);
    }

    SECTION("Failed redeem restores the burned shares") {
        f.vault->deposit(ALICE, hundred, ALICE);
        f.market->fail_next_redeem(status::TOKEN_INSUFFICIENT_CASH);

        REQUIRE_THROWS_AS(f.vault->redeem(ALICE, hundred, ALICE, ALICE), MarketOperationFailed);
        REQUIRE(f.vault->balance_of(ALICE) == hundred);
        REQUIRE(f.vault->total_supply() == hundred);
        REQUIRE(f.market->balance_of(VAULT) == hundred);
        REQUIRE(f.asset.balance_of(ALICE) == wad::from_int(900));
    }

    SECTION("Short payout from the market is detected") {
        f.vault->deposit(ALICE, hundred, ALICE);
        f.market->set_skim(Wad(1));

        REQUIRE_THROWS_AS(f.vault->withdraw(ALICE, wad::from_int(50), ALICE, ALICE),
                          MarketBalanceMismatch);
        REQUIRE(f.vault->balance_of(ALICE) == hundred);
        REQUIRE(f.asset.balance_of(ALICE) == wad::from_int(900));

        // The partial payout went back into the market; only the skimmed wei is gone
        REQUIRE(f.asset.balance_of(VAULT) == 0);
        REQUIRE(f.market->balance_of(VAULT) == hundred - Wad(1));
        REQUIRE(f.vault->total_assets() == hundred - Wad(1));
        REQUIRE(f.asset.allowance(VAULT, MARKET) == 0);
    }

    SECTION("Short payout the market will not take back") {
        f.vault->deposit(ALICE, hundred, ALICE);
        f.market->set_skim(Wad(1));
        f.market->set_mint_paused(true);

        REQUIRE_THROWS_AS(f.vault->withdraw(ALICE, wad::from_int(50), ALICE, ALICE),
                          MarketOperationFailed);
        REQUIRE(f.vault->balance_of(ALICE) == hundred);
        REQUIRE(f.asset.balance_of(ALICE) == wad::from_int(900));
    }

    SECTION("Vault is usable after a rollback") {
        f.market->fail_next_mint(status::COMPTROLLER_REJECTION);
        REQUIRE_THROWS_AS(f.vault->deposit(ALICE, hundred, ALICE), MarketOperationFailed);
        REQUIRE(f.vault->deposit(ALICE, hundred, ALICE) == hundred);
    }
}

TEST_CASE("Re-entry from the market is rejected", "[vault]") {
    VaultFixture f;
    Wad hundred = wad::from_int(100);

    SECTION("Nested deposit during mint") {
        bool rejected = false;
        f.market->set_reentry_hook([&] {
            try {
                f.vault->deposit(BOB, hundred, BOB);
            } catch (const Reentrancy&) {
                rejected = true;
            }
        });

        REQUIRE(f.vault->deposit(ALICE, hundred, ALICE) == hundred);
        REQUIRE(rejected);
        REQUIRE(f.vault->balance_of(BOB) == 0);
        REQUIRE(f.asset.balance_of(BOB) == wad::from_int(1000));
    }

    SECTION("Nested share transfer during redeem") {
        f.vault->deposit(ALICE, hundred, ALICE);
        f.market->set_reentry_hook([&] { f.vault->transfer(ALICE, BOB, WAD); });

        REQUIRE_THROWS_AS(f.vault->redeem(ALICE, hundred, ALICE, ALICE), Reentrancy);
        REQUIRE(f.vault->balance_of(ALICE) == hundred);
        REQUIRE(f.vault->balance_of(BOB) == 0);
    }

    SECTION("Share bookkeeping is final when the market runs") {
        Wad seen;
        f.market->set_reentry_hook([&] { seen = f.vault->balance_of(ALICE); });
        f.vault->deposit(ALICE, hundred, ALICE);
        REQUIRE(seen == hundred);
    }
}

TEST_CASE("Share allowances", "[vault]") {
    VaultFixture f;
    Wad hundred = wad::from_int(100);
    f.vault->deposit(ALICE, hundred, ALICE);

    SECTION("Redeem on behalf of the owner spends allowance") {
        f.vault->approve(ALICE, BOB, wad::from_int(60));
        f.vault->redeem(BOB, wad::from_int(40), BOB, ALICE);
        REQUIRE(f.vault->allowance(ALICE, BOB) == wad::from_int(20));
        REQUIRE(f.asset.balance_of(BOB) == wad::from_int(1040));
    }

    SECTION("Insufficient allowance") {
        f.vault->approve(ALICE, BOB, wad::from_int(10));
        REQUIRE_THROWS_AS(f.vault->redeem(BOB, wad::from_int(40), BOB, ALICE),
                          InsufficientAllowance);
        REQUIRE(f.vault->balance_of(ALICE) == hundred);
        REQUIRE(f.vault->allowance(ALICE, BOB) == wad::from_int(10));
    }

    SECTION("Allowance restored when the market fails") {
        f.vault->approve(ALICE, BOB, wad::from_int(60));
        f.market->fail_next_redeem(status::MARKET_NOT_FRESH);
        REQUIRE_THROWS_AS(f.vault->withdraw(BOB, wad::from_int(40), BOB, ALICE),
                          MarketOperationFailed);
        REQUIRE(f.vault->allowance(ALICE, BOB) == wad::from_int(60));
    }

    SECTION("Share transfer_from") {
        f.vault->approve(ALICE, BOB, MAX_WAD);
        f.vault->transfer_from(BOB, ALICE, BOB, wad::from_int(30));
        REQUIRE(f.vault->balance_of(BOB) == wad::from_int(30));
        REQUIRE(f.vault->allowance(ALICE, BOB) == MAX_WAD);
    }
}

TEST_CASE("Rewards are forwarded to the recipient", "[vault]") {
    VaultFixture f;
    TokenLedger comp(addresses::from_id(0xC03F), "COMP");
    FixedRewards distributor(comp, wad::from_int(7));

    REQUIRE(f.vault->claim_rewards(distributor, comp) == wad::from_int(7));
    REQUIRE(distributor.claimed_by == VAULT);
    REQUIRE(comp.balance_of(RECIPIENT) == wad::from_int(7));
    REQUIRE(comp.balance_of(VAULT) == 0);

    SECTION("Nothing accrued") {
        FixedRewards empty(comp, Wad(0));
        REQUIRE(f.vault->claim_rewards(empty, comp) == 0);
    }
}

TEST_CASE("Market that keeps funds while failing", "[vault]") {
    ManualClock clock(1700000000);
    TokenLedger asset(ASSET, "DAI");
    auto market = std::make_shared<PullingMarket>(MARKET, asset, status::TOKEN_INSUFFICIENT_BALANCE);
    Vault vault(VAULT, asset, market, clock, RECIPIENT);

    asset.mint(ALICE, wad::from_int(1000));
    asset.approve(ALICE, VAULT, MAX_WAD);

    // The refund cannot be paid, which surfaces as an error instead of aborting
    REQUIRE_THROWS_AS(vault.deposit(ALICE, wad::from_int(100), ALICE), InsufficientBalance);
    REQUIRE(vault.total_supply() == 0);
    REQUIRE(vault.balance_of(ALICE) == 0);
    REQUIRE(asset.allowance(VAULT, MARKET) == 0);

    // Guard was released, so the retry reaches the market again
    REQUIRE_THROWS_AS(vault.deposit(ALICE, wad::from_int(100), ALICE), InsufficientBalance);
}

TEST_CASE("Committed deposit is not revalued when debug logging is off", "[vault]") {
    log::Level saved = log::level();
    log::set_level(log::Level::Info);

    ManualClock clock(1700000000);
    TokenLedger asset(ASSET, "DAI");
    auto market = std::make_shared<PullingMarket>(MARKET, asset, status::OK);
    Vault vault(VAULT, asset, market, clock, RECIPIENT);

    asset.mint(ALICE, wad::from_int(1000));
    asset.approve(ALICE, VAULT, MAX_WAD);

    market->go_stale(1699999000);
    REQUIRE_THROWS_AS(vault.total_assets(), RateTooHigh);

    Wad shares = vault.deposit(ALICE, wad::from_int(100), ALICE);
    log::set_level(saved);

    REQUIRE(shares == wad::from_int(100));
    REQUIRE(vault.balance_of(ALICE) == wad::from_int(100));
    REQUIRE(market->balance_of(VAULT) == wad::from_int(100));
}
