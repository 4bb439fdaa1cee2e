// =============================================================================
// comptroller.cpp - Simulated Lending Market (Compound-style accounting)
// =============================================================================

#include "lever/comptroller.hpp"

#include <algorithm>
#include <stdexcept>

#include "lever/error.hpp"
#include "lever/log.hpp"

namespace lever {

namespace {

nlohmann::json address_list(const std::vector<Address>& addrs) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& a : addrs) list.push_back(to_hex(a));
    return list;
}

nlohmann::json amount_list(const std::vector<U256>& values) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& v : values) list.push_back(v.str());
    return list;
}

} // namespace

SimulatedComptroller::SimulatedComptroller(Chain& chain, TokenLedger& tokens,
                                           const AccessControlManager& acm,
                                           const IResilientOracle& oracle, PoolTopology topology)
    : chain_(chain),
      tokens_(tokens),
      acm_(acm),
      oracle_(oracle),
      topology_(topology),
      self_(chain.create_address("Comptroller")),
      state_(chain) {}

// =============================================================================
// Internal Helpers
// =============================================================================

MarketRecord* SimulatedComptroller::find_market(const Address& market) {
    auto& markets = state_->markets;
    auto it = markets.find(market);
    return it == markets.end() ? nullptr : &it->second;
}

const MarketRecord* SimulatedComptroller::find_market(const Address& market) const {
    const auto& markets = state_.get().markets;
    auto it = markets.find(market);
    return it == markets.end() ? nullptr : &it->second;
}

MarketRecord& SimulatedComptroller::listed_market(const Address& market) {
    MarketRecord* record = find_market(market);
    if (record == nullptr || !record->listed) throw ContractError(ErrorCode::MarketNotListed, market);
    return *record;
}

void SimulatedComptroller::require_lengths(size_t markets, size_t values) const {
    if (markets == 0 || markets != values) {
        throw std::invalid_argument("market and value lists must be non-empty and of equal length");
    }
}

void SimulatedComptroller::accrue(const Address& market, MarketRecord& record) {
    uint64_t now = chain_.now();
    if (now <= record.accrual_timestamp) return;

    U256 elapsed = U256(now - record.accrual_timestamp);
    record.accrual_timestamp = now;
    if (record.config.borrow_rate_per_second == 0) return;

    U256 factor = record.config.borrow_rate_per_second * elapsed;
    U256 interest = mantissa::mul(factor, record.total_borrows);
    record.total_borrows += interest;
    record.total_reserves += mantissa::mul(record.config.reserve_factor, interest);
    record.borrow_index += mantissa::mul(factor, record.borrow_index);

    chain_.emit(market, "AccrueInterest",
                {{"interestAccumulated", interest.str()},
                 {"borrowIndex", record.borrow_index.str()},
                 {"totalBorrows", record.total_borrows.str()}});
}

U256 SimulatedComptroller::cash(const MarketRecord& record, const Address& market) const {
    return tokens_.balance_of(record.config.underlying, market);
}

U256 SimulatedComptroller::exchange_rate(const MarketRecord& record, const Address& market) const {
    if (record.total_supply == 0) return record.config.initial_exchange_rate;
    U256 gross = cash(record, market) + record.flash_loans_outstanding + record.total_borrows;
    if (gross <= record.total_reserves) return U256(0);
    return amounts::mul_div(gross - record.total_reserves, EXP_SCALE, record.total_supply);
}

U256 SimulatedComptroller::stored_borrow(const MarketRecord& record, const Address& account) const {
    auto it = record.accounts.find(account);
    if (it == record.accounts.end() || it->second.borrow_principal == 0) return U256(0);
    return amounts::mul_div(it->second.borrow_principal, record.borrow_index, it->second.interest_index);
}

bool SimulatedComptroller::can_act_for(const Address& caller, const Address& account) const {
    return caller == account || state_.get().delegates.count({account, caller}) != 0;
}

void SimulatedComptroller::add_asset(const Address& account, const Address& market) {
    auto& assets = state_->assets_in[account];
    if (std::find(assets.begin(), assets.end(), market) != assets.end()) return;
    assets.push_back(market);
    chain_.emit(self_, "MarketEntered", {{"market", to_hex(market)}, {"account", to_hex(account)}});
}

AccountLiquidity SimulatedComptroller::hypothetical_liquidity(const Address& account, const Address& modified,
                                                              const U256& redeem_shares,
                                                              const U256& borrow_amount) const {
    const State& state = state_.get();
    std::vector<Address> assets;
    auto held = state.assets_in.find(account);
    if (held != state.assets_in.end()) assets = held->second;
    if (borrow_amount > 0 && !is_zero(modified) &&
        std::find(assets.begin(), assets.end(), modified) == assets.end()) {
        assets.push_back(modified);
    }

    U256 collateral;
    U256 borrows;
    for (const auto& asset : assets) {
        const MarketRecord* record = find_market(asset);
        if (record == nullptr) continue;

        U256 price = oracle_.get_underlying_price(asset);
        if (price == 0) return AccountLiquidity{market_errors::PRICE_ERROR, 0, 0};

        U256 factor;
        auto pm = state.pool_markets.find({0, asset});
        if (pm != state.pool_markets.end() && pm->second.listed) factor = pm->second.collateral_factor;

        U256 rate = exchange_rate(*record, asset);
        U256 shares;
        auto acct = record->accounts.find(account);
        if (acct != record->accounts.end()) shares = acct->second.shares;

        // USD value (1e18) of an underlying amount: amount * price / 1e18
        auto weighted = [&](const U256& share_amount) {
            U256 underlying = amounts::mul_div(share_amount, rate, EXP_SCALE);
            return amounts::mul_div(amounts::mul_div(underlying, factor, EXP_SCALE), price, EXP_SCALE);
        };

        collateral += weighted(shares);
        borrows += amounts::mul_div(stored_borrow(*record, account), price, EXP_SCALE);

        if (asset == modified) {
            borrows += weighted(redeem_shares);
            borrows += amounts::mul_div(borrow_amount, price, EXP_SCALE);
        }
    }

    if (collateral >= borrows) return AccountLiquidity{market_errors::OK, collateral - borrows, 0};
    return AccountLiquidity{market_errors::OK, 0, borrows - collateral};
}

uint32_t SimulatedComptroller::borrow_fresh(const Address& borrower, const Address& market,
                                            const U256& amount, const Address& recipient) {
    MarketRecord* record = find_market(market);
    if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
    if (record->paused.count(Action::BORROW) != 0) return market_errors::ACTION_PAUSED;

    auto pm = state_.get().pool_markets.find({0, market});
    if (pm != state_.get().pool_markets.end() && !pm->second.borrow_allowed) {
        return market_errors::BORROW_NOT_ALLOWED;
    }

    accrue(market, *record);

    if (record->borrow_cap && record->total_borrows + amount > *record->borrow_cap) {
        return market_errors::BORROW_CAP_REACHED;
    }
    if (!is_zero(recipient) && cash(*record, market) < amount) return market_errors::INSUFFICIENT_CASH;

    AccountLiquidity liquidity = hypothetical_liquidity(borrower, market, 0, amount);
    if (liquidity.error != market_errors::OK) return liquidity.error;
    if (liquidity.shortfall > 0) return market_errors::INSUFFICIENT_LIQUIDITY;

    add_asset(borrower, market);

    record = find_market(market);
    U256 account_borrows = stored_borrow(*record, borrower) + amount;
    auto& snapshot = record->accounts[borrower];
    snapshot.borrow_principal = account_borrows;
    snapshot.interest_index = record->borrow_index;
    record->total_borrows += amount;
    U256 total_borrows = record->total_borrows;
    Address underlying = record->config.underlying;

    if (!is_zero(recipient)) tokens_.transfer(market, underlying, recipient, amount);

    chain_.emit(market, "Borrow",
                {{"borrower", to_hex(borrower)},
                 {"borrowAmount", amount.str()},
                 {"accountBorrows", account_borrows.str()},
                 {"totalBorrows", total_borrows.str()}});
    return market_errors::OK;
}

// =============================================================================
// Administration
// =============================================================================

Address SimulatedComptroller::support_market(const Address& caller, const MarketConfig& config) {
    return chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SUPPORT_MARKET);
        if (is_zero(config.underlying)) throw ContractError(ErrorCode::ZeroAddress);
        if (!tokens_.exists(config.underlying)) throw ContractError(ErrorCode::UnknownToken, config.underlying);
        if (config.initial_exchange_rate == 0) throw std::invalid_argument("initial exchange rate must be non-zero");

        std::string label = config.symbol.empty() ? "v" + tokens_.symbol(config.underlying) : config.symbol;
        Address market = chain_.create_address(label);

        MarketRecord record;
        record.config = config;
        record.config.symbol = label;
        record.listed = true;
        record.accrual_timestamp = chain_.now();

        auto& state = state_.mut();
        state.markets[market] = std::move(record);
        state.market_list.push_back(market);
        state.pool_markets[{0, market}] = PoolMarket{true, 0, 0, true};

        chain_.emit(self_, "MarketListed", {{"market", to_hex(market)}, {"underlying", to_hex(config.underlying)}});
        Logger::info("comptroller: listed {} ({})", label, to_hex(market));
        return market;
    });
}

uint32_t SimulatedComptroller::add_pool(const Address& caller, const std::string& label) {
    return chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::CREATE_POOL);
        if (topology_ != PoolTopology::CORE) throw std::logic_error("pools are only supported by a core comptroller");

        uint32_t pool_id = ++state_->last_pool_id;
        chain_.emit(self_, "PoolCreated", {{"poolId", pool_id}, {"label", label}});
        return pool_id;
    });
}

void SimulatedComptroller::add_pool_market(const Address& caller, uint32_t pool_id, const Address& market) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::ADD_POOL_MARKET);
        if (pool_id == 0 || pool_id > state_.get().last_pool_id) {
            throw std::invalid_argument("unknown pool id " + std::to_string(pool_id));
        }
        listed_market(market);

        auto& entry = state_->pool_markets[{pool_id, market}];
        if (entry.listed) return;
        entry = PoolMarket{true, 0, 0, true};
        chain_.emit(self_, "PoolMarketInitialized", {{"poolId", pool_id}, {"market", to_hex(market)}});
    });
}

void SimulatedComptroller::set_is_borrow_allowed(const Address& caller, uint32_t pool_id,
                                                 const Address& market, bool allowed) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_IS_BORROW_ALLOWED);
        auto& pools = state_->pool_markets;
        auto it = pools.find({pool_id, market});
        if (it == pools.end() || !it->second.listed) throw ContractError(ErrorCode::MarketNotListed, market);

        it->second.borrow_allowed = allowed;
        chain_.emit(self_, "BorrowAllowedUpdated",
                    {{"poolId", pool_id}, {"market", to_hex(market)}, {"allowed", allowed}});
    });
}

void SimulatedComptroller::set_treasury_data(const Address& caller, const Address& treasury, const U256& percent) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_TREASURY_DATA);
        if (is_zero(treasury)) throw ContractError(ErrorCode::ZeroAddress);
        if (percent >= EXP_SCALE) throw std::invalid_argument("treasury percent must be below 1e18");

        auto& state = state_.mut();
        state.treasury = treasury;
        state.treasury_percent = percent;
        chain_.emit(self_, "NewTreasuryData", {{"treasury", to_hex(treasury)}, {"percent", percent.str()}});
    });
}

void SimulatedComptroller::set_protocol_share_reserve(const Address& caller, const Address& reserve) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_PROTOCOL_SHARE_RESERVE);
        if (is_zero(reserve)) throw ContractError(ErrorCode::ZeroAddress);

        Address old = state_.get().protocol_share_reserve;
        state_->protocol_share_reserve = reserve;
        chain_.emit(self_, "NewProtocolShareReserve", {{"oldAddress", to_hex(old)}, {"newAddress", to_hex(reserve)}});
    });
}

void SimulatedComptroller::set_whitelisted_flash_loan_account(const Address& caller, const Address& account,
                                                              bool allowed) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_FLASH_LOAN_WHITELIST);
        if (is_zero(account)) throw ContractError(ErrorCode::ZeroAddress);

        if (allowed) {
            state_->flash_loan_whitelist.insert(account);
        } else {
            state_->flash_loan_whitelist.erase(account);
        }
        chain_.emit(self_, "IsAccountFlashLoanWhitelisted", {{"account", to_hex(account)}, {"isWhitelisted", allowed}});
    });
}

void SimulatedComptroller::set_whitelisted_executor(const Address& caller, const Address& account, bool allowed) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_WHITELISTED_EXECUTOR);
        if (is_zero(account)) throw ContractError(ErrorCode::ZeroAddress);

        if (allowed) {
            state_->executors.insert(account);
        } else {
            state_->executors.erase(account);
        }
        chain_.emit(self_, "WhitelistedExecutorUpdated", {{"account", to_hex(account)}, {"isWhitelisted", allowed}});
    });
}

void SimulatedComptroller::set_borrow_rate(const Address& caller, const Address& market, const U256& rate_per_second) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_BORROW_RATE);
        MarketRecord& record = listed_market(market);
        accrue(market, record);

        U256 old = record.config.borrow_rate_per_second;
        record.config.borrow_rate_per_second = rate_per_second;
        chain_.emit(market, "NewBorrowRate", {{"oldRate", old.str()}, {"newRate", rate_per_second.str()}});
    });
}

// =============================================================================
// Markets & Topology
// =============================================================================

bool SimulatedComptroller::is_listed(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record != nullptr && record->listed;
    });
}

Address SimulatedComptroller::underlying(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        if (record == nullptr) throw ContractError(ErrorCode::MarketNotListed, market);
        return record->config.underlying;
    });
}

std::vector<Address> SimulatedComptroller::all_markets() const {
    return chain_.read([&] { return state_.get().market_list; });
}

uint32_t SimulatedComptroller::last_pool_id() const {
    return chain_.read([&] { return state_.get().last_pool_id; });
}

PoolMarket SimulatedComptroller::pool_market(uint32_t pool_id, const Address& market) const {
    return chain_.read([&] {
        const auto& pools = state_.get().pool_markets;
        auto it = pools.find({pool_id, market});
        return it == pools.end() ? PoolMarket{} : it->second;
    });
}

bool SimulatedComptroller::action_paused(const Address& market, Action action) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record != nullptr && record->paused.count(action) != 0;
    });
}

U256 SimulatedComptroller::treasury_percent() const {
    return chain_.read([&] { return state_.get().treasury_percent; });
}

Address SimulatedComptroller::protocol_share_reserve() const {
    return chain_.read([&] { return state_.get().protocol_share_reserve; });
}

Address SimulatedComptroller::treasury() const {
    return chain_.read([&] { return state_.get().treasury; });
}

bool SimulatedComptroller::is_native_market(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record != nullptr && record->config.native;
    });
}

// =============================================================================
// Accounts
// =============================================================================

bool SimulatedComptroller::approved_delegates(const Address& account, const Address& delegate) const {
    return chain_.read([&] { return state_.get().delegates.count({account, delegate}) != 0; });
}

std::vector<Address> SimulatedComptroller::assets_in(const Address& account) const {
    return chain_.read([&] {
        const auto& assets = state_.get().assets_in;
        auto it = assets.find(account);
        return it == assets.end() ? std::vector<Address>{} : it->second;
    });
}

uint32_t SimulatedComptroller::mint_behalf(const Address& caller, const Address& minter,
                                           const Address& market, const U256& amount) {
    return chain_.transact([&]() -> uint32_t {
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        if (record->paused.count(Action::MINT) != 0) return market_errors::ACTION_PAUSED;

        accrue(market, *record);

        U256 rate = exchange_rate(*record, market);
        if (record->supply_cap) {
            U256 supplied = amounts::mul_div(record->total_supply, rate, EXP_SCALE);
            if (supplied + amount > *record->supply_cap) return market_errors::SUPPLY_CAP_REACHED;
        }

        tokens_.transfer_from(market, record->config.underlying, caller, market, amount);

        record = find_market(market);
        U256 shares = amounts::mul_div(amount, EXP_SCALE, rate);
        record->accounts[minter].shares += shares;
        record->total_supply += shares;

        chain_.emit(market, "Mint",
                    {{"payer", to_hex(caller)}, {"minter", to_hex(minter)},
                     {"mintAmount", amount.str()}, {"mintTokens", shares.str()}});
        return market_errors::OK;
    });
}

uint32_t SimulatedComptroller::enter_market_behalf(const Address& caller, const Address& account,
                                                   const Address& market) {
    return chain_.transact([&]() -> uint32_t {
        if (!can_act_for(caller, account)) return market_errors::DELEGATE_NOT_APPROVED;
        const MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        if (record->paused.count(Action::ENTER_MARKET) != 0) return market_errors::ACTION_PAUSED;

        add_asset(account, market);
        return market_errors::OK;
    });
}

uint32_t SimulatedComptroller::borrow_behalf(const Address& caller, const Address& borrower,
                                             const Address& market, const U256& amount) {
    return chain_.transact([&]() -> uint32_t {
        if (!can_act_for(caller, borrower)) return market_errors::DELEGATE_NOT_APPROVED;
        return borrow_fresh(borrower, market, amount, caller);
    });
}

uint32_t SimulatedComptroller::repay_borrow_behalf(const Address& caller, const Address& borrower,
                                                   const Address& market, const U256& amount) {
    return chain_.transact([&]() -> uint32_t {
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        if (record->paused.count(Action::REPAY) != 0) return market_errors::ACTION_PAUSED;

        accrue(market, *record);

        U256 debt = stored_borrow(*record, borrower);
        U256 repay = amount == MAX_U256 ? debt : amount;
        if (repay > debt) return market_errors::TOO_MUCH_REPAY;

        tokens_.transfer_from(market, record->config.underlying, caller, market, repay);

        record = find_market(market);
        U256 account_borrows = debt - repay;
        auto& snapshot = record->accounts[borrower];
        snapshot.borrow_principal = account_borrows;
        snapshot.interest_index = record->borrow_index;
        // Rounding in the index can leave the aggregate marginally below the sum of debts
        record->total_borrows = record->total_borrows > repay ? record->total_borrows - repay : U256(0);

        chain_.emit(market, "RepayBorrow",
                    {{"payer", to_hex(caller)}, {"borrower", to_hex(borrower)},
                     {"repayAmount", repay.str()}, {"accountBorrows", account_borrows.str()},
                     {"totalBorrows", record->total_borrows.str()}});
        return market_errors::OK;
    });
}

uint32_t SimulatedComptroller::redeem_underlying_behalf(const Address& caller, const Address& redeemer,
                                                        const Address& market, const U256& amount) {
    return chain_.transact([&]() -> uint32_t {
        if (!can_act_for(caller, redeemer)) return market_errors::DELEGATE_NOT_APPROVED;
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        if (record->paused.count(Action::REDEEM) != 0) return market_errors::ACTION_PAUSED;

        accrue(market, *record);

        U256 rate = exchange_rate(*record, market);
        if (rate == 0) return market_errors::INSUFFICIENT_CASH;
        return redeem_fresh(caller, redeemer, market, amounts::mul_div_up(amount, EXP_SCALE, rate), amount);
    });
}

uint32_t SimulatedComptroller::redeem_behalf(const Address& caller, const Address& redeemer,
                                             const Address& market, const U256& shares) {
    return chain_.transact([&]() -> uint32_t {
        if (!can_act_for(caller, redeemer)) return market_errors::DELEGATE_NOT_APPROVED;
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        if (record->paused.count(Action::REDEEM) != 0) return market_errors::ACTION_PAUSED;

        accrue(market, *record);

        U256 rate = exchange_rate(*record, market);
        return redeem_fresh(caller, redeemer, market, shares, amounts::mul_div(shares, rate, EXP_SCALE));
    });
}

uint32_t SimulatedComptroller::redeem_fresh(const Address& caller, const Address& redeemer,
                                            const Address& market, const U256& shares, const U256& amount) {
    MarketRecord* record = find_market(market);
    auto acct = record->accounts.find(redeemer);
    U256 held = acct == record->accounts.end() ? U256(0) : acct->second.shares;
    if (shares > held) return market_errors::INSUFFICIENT_BALANCE;
    if (cash(*record, market) < amount) return market_errors::INSUFFICIENT_CASH;

    AccountLiquidity liquidity = hypothetical_liquidity(redeemer, market, shares, 0);
    if (liquidity.error != market_errors::OK) return liquidity.error;
    if (liquidity.shortfall > 0) return market_errors::INSUFFICIENT_LIQUIDITY;

    record->accounts[redeemer].shares -= shares;
    record->total_supply -= shares;
    Address token = record->config.underlying;

    const State& state = state_.get();
    U256 fee = mantissa::mul(amount, state.treasury_percent);
    Address treasury = state.treasury;
    if (fee > 0) tokens_.transfer(market, token, treasury, fee);
    tokens_.transfer(market, token, caller, amount - fee);

    chain_.emit(market, "Redeem",
                {{"redeemer", to_hex(redeemer)}, {"redeemAmount", amount.str()},
                 {"redeemTokens", shares.str()}, {"treasuryFee", fee.str()}});
    return market_errors::OK;
}

uint32_t SimulatedComptroller::seize(const Address& caller, const Address& market, const Address& borrower,
                                     const Address& recipient, const U256& shares) {
    return chain_.transact([&]() -> uint32_t {
        if (state_.get().executors.count(caller) == 0) return market_errors::UNAUTHORIZED;
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        if (record->paused.count(Action::SEIZE) != 0) return market_errors::ACTION_PAUSED;
        if (borrower == recipient) return market_errors::REJECTION;

        auto acct = record->accounts.find(borrower);
        U256 held = acct == record->accounts.end() ? U256(0) : acct->second.shares;
        if (shares > held) return market_errors::INSUFFICIENT_BALANCE;

        record->accounts[borrower].shares -= shares;
        record->accounts[recipient].shares += shares;

        chain_.emit(market, "Seize",
                    {{"executor", to_hex(caller)}, {"borrower", to_hex(borrower)},
                     {"recipient", to_hex(recipient)}, {"seizeTokens", shares.str()}});
        return market_errors::OK;
    });
}

uint32_t SimulatedComptroller::accrue_interest(const Address& market) {
    return chain_.transact([&]() -> uint32_t {
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;
        accrue(market, *record);
        return market_errors::OK;
    });
}

// =============================================================================
// Balances
// =============================================================================

U256 SimulatedComptroller::borrow_balance_current(const Address& market, const Address& account) {
    return chain_.transact([&] {
        MarketRecord* record = find_market(market);
        if (record == nullptr) throw ContractError(ErrorCode::MarketNotListed, market);
        accrue(market, *record);
        return stored_borrow(*record, account);
    });
}

U256 SimulatedComptroller::borrow_balance_stored(const Address& market, const Address& account) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? U256(0) : stored_borrow(*record, account);
    });
}

U256 SimulatedComptroller::balance_of_underlying(const Address& market, const Address& account) {
    return chain_.transact([&] {
        MarketRecord* record = find_market(market);
        if (record == nullptr) throw ContractError(ErrorCode::MarketNotListed, market);
        accrue(market, *record);

        auto acct = record->accounts.find(account);
        if (acct == record->accounts.end()) return U256(0);
        return amounts::mul_div(acct->second.shares, exchange_rate(*record, market), EXP_SCALE);
    });
}

U256 SimulatedComptroller::exchange_rate_stored(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        if (record == nullptr) throw ContractError(ErrorCode::MarketNotListed, market);
        return exchange_rate(*record, market);
    });
}

U256 SimulatedComptroller::total_supply(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? U256(0) : record->total_supply;
    });
}

AccountLiquidity SimulatedComptroller::get_account_liquidity(const Address& account) const {
    return chain_.read([&] { return hypothetical_liquidity(account, ZERO_ADDRESS, 0, 0); });
}

// =============================================================================
// Flash Loans
// =============================================================================

void SimulatedComptroller::execute_flash_loan(const Address& caller, const Address& on_behalf,
                                              IFlashLoanReceiver& receiver,
                                              const std::vector<Address>& markets,
                                              const std::vector<U256>& amounts,
                                              const Bytes& data) {
    chain_.transact([&] {
        if (state_.get().flash_loan_whitelist.count(caller) == 0) {
            throw ContractError(ErrorCode::Unauthorized, caller);
        }
        if (!can_act_for(caller, on_behalf)) throw ContractError(ErrorCode::NotAnApprovedDelegate, caller);
        if (markets.empty() || markets.size() != amounts.size()) {
            throw ContractError(ErrorCode::FlashLoanAssetOrAmountMismatch);
        }

        Address receiver_address = receiver.address();
        std::vector<U256> premiums;
        premiums.reserve(markets.size());

        for (size_t i = 0; i < markets.size(); ++i) {
            MarketRecord& record = listed_market(markets[i]);
            if (!record.config.flash_loan_enabled) throw ContractError(ErrorCode::FlashLoanNotEnabled, markets[i]);
            if (amounts[i] == 0) throw ContractError(ErrorCode::ZeroAmount);

            accrue(markets[i], record);
            premiums.push_back(mantissa::mul(amounts[i], record.config.flash_loan_fee));
            record.flash_loans_outstanding += amounts[i];
            tokens_.transfer(markets[i], record.config.underlying, receiver_address, amounts[i]);
        }

        Logger::debug("comptroller: flash loan of {} market(s) to {}", markets.size(), to_hex(receiver_address));

        std::vector<U256> repayments =
            receiver.execute_operation(self_, markets, amounts, premiums, caller, on_behalf, data);
        if (repayments.size() != markets.size()) throw ContractError(ErrorCode::FlashLoanAssetOrAmountMismatch);

        for (size_t i = 0; i < markets.size(); ++i) {
            const Address& market = markets[i];
            U256 owed = amounts[i] + premiums[i];
            U256 repaid = std::min(repayments[i], owed);
            Address token = find_market(market)->config.underlying;

            if (repaid > 0) tokens_.transfer_from(market, token, receiver_address, market, repaid);
            MarketRecord* record = find_market(market);
            record->flash_loans_outstanding -= amounts[i];
            record->total_reserves += premiums[i];

            if (repaid < owed) {
                uint32_t code = borrow_fresh(on_behalf, market, owed - repaid, ZERO_ADDRESS);
                if (code != market_errors::OK) {
                    throw ContractError(ErrorCode::InsufficientRepayment, "code " + std::to_string(code));
                }
            }
        }

        chain_.emit(self_, "FlashLoanExecuted",
                    {{"receiver", to_hex(receiver_address)},
                     {"initiator", to_hex(caller)},
                     {"onBehalf", to_hex(on_behalf)},
                     {"markets", address_list(markets)},
                     {"amounts", amount_list(amounts)},
                     {"premiums", amount_list(premiums)}});
    });
}

// =============================================================================
// Governance
// =============================================================================

void SimulatedComptroller::set_actions_paused(const Address& caller, const std::vector<Address>& markets,
                                              const std::vector<Action>& actions, bool paused) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_ACTIONS_PAUSED);
        for (const auto& market : markets) {
            MarketRecord& record = listed_market(market);
            for (Action action : actions) {
                if (paused) {
                    record.paused.insert(action);
                } else {
                    record.paused.erase(action);
                }
                chain_.emit(self_, "ActionPausedMarket",
                            {{"market", to_hex(market)}, {"action", static_cast<int>(action)}, {"pauseState", paused}});
            }
        }
    });
}

void SimulatedComptroller::set_collateral_factor(const Address& caller, uint32_t pool_id, const Address& market,
                                                 const U256& collateral_factor,
                                                 const U256& liquidation_threshold) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_COLLATERAL_FACTOR);
        listed_market(market);
        if (topology_ == PoolTopology::ISOLATED && pool_id != 0) {
            throw std::invalid_argument("isolated comptroller has a single pool");
        }

        auto& pools = state_->pool_markets;
        auto it = pools.find({pool_id, market});
        if (it == pools.end() || !it->second.listed) throw ContractError(ErrorCode::MarketNotListed, market);
        if (collateral_factor > liquidation_threshold || liquidation_threshold > EXP_SCALE) {
            throw ContractError(ErrorCode::InvalidCollateralFactor,
                                collateral_factor.str() + ", " + liquidation_threshold.str());
        }

        PoolMarket& entry = it->second;
        U256 old_cf = entry.collateral_factor;
        U256 old_lt = entry.liquidation_threshold;
        entry.collateral_factor = collateral_factor;
        entry.liquidation_threshold = liquidation_threshold;

        if (old_cf != collateral_factor) {
            chain_.emit(self_, "NewCollateralFactor",
                        {{"poolId", pool_id}, {"market", to_hex(market)},
                         {"oldCollateralFactor", old_cf.str()}, {"newCollateralFactor", collateral_factor.str()}});
        }
        if (old_lt != liquidation_threshold) {
            chain_.emit(self_, "NewLiquidationThreshold",
                        {{"poolId", pool_id}, {"market", to_hex(market)},
                         {"oldLiquidationThreshold", old_lt.str()},
                         {"newLiquidationThreshold", liquidation_threshold.str()}});
        }
    });
}

void SimulatedComptroller::set_market_supply_caps(const Address& caller, const std::vector<Address>& markets,
                                                  const std::vector<U256>& caps) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_SUPPLY_CAPS);
        require_lengths(markets.size(), caps.size());
        for (size_t i = 0; i < markets.size(); ++i) {
            listed_market(markets[i]).supply_cap = caps[i];
            chain_.emit(self_, "NewSupplyCap", {{"market", to_hex(markets[i])}, {"newSupplyCap", caps[i].str()}});
        }
    });
}

void SimulatedComptroller::set_market_borrow_caps(const Address& caller, const std::vector<Address>& markets,
                                                  const std::vector<U256>& caps) {
    chain_.transact([&] {
        acm_.check_access(caller, self_, signatures::SET_BORROW_CAPS);
        require_lengths(markets.size(), caps.size());
        for (size_t i = 0; i < markets.size(); ++i) {
            listed_market(markets[i]).borrow_cap = caps[i];
            chain_.emit(self_, "NewBorrowCap", {{"market", to_hex(markets[i])}, {"newBorrowCap", caps[i].str()}});
        }
    });
}

uint32_t SimulatedComptroller::unlist_market(const Address& caller, const Address& market) {
    return chain_.transact([&]() -> uint32_t {
        acm_.check_access(caller, self_, signatures::UNLIST_MARKET);
        MarketRecord* record = find_market(market);
        if (record == nullptr || !record->listed) return market_errors::MARKET_NOT_LISTED;

        for (Action action : {Action::MINT, Action::BORROW, Action::ENTER_MARKET}) {
            if (record->paused.count(action) == 0) return market_errors::REJECTION;
        }
        if (!record->supply_cap || *record->supply_cap != 0) return market_errors::REJECTION;
        if (!record->borrow_cap || *record->borrow_cap != 0) return market_errors::REJECTION;

        auto& pools = state_->pool_markets;
        auto core = pools.find({0, market});
        if (core != pools.end() && core->second.collateral_factor != 0) return market_errors::REJECTION;

        record->listed = false;
        for (auto& [key, entry] : pools) {
            if (key.second == market) entry.listed = false;
        }

        chain_.emit(self_, "MarketUnlisted", {{"market", to_hex(market)}});
        Logger::info("comptroller: unlisted {}", to_hex(market));
        return market_errors::OK;
    });
}

// =============================================================================
// User Entry Points
// =============================================================================

void SimulatedComptroller::update_delegate(const Address& caller, const Address& delegate, bool approved) {
    chain_.transact([&] {
        if (is_zero(delegate)) throw ContractError(ErrorCode::ZeroAddress);
        if (approved) {
            state_->delegates.insert({caller, delegate});
        } else {
            state_->delegates.erase({caller, delegate});
        }
        chain_.emit(self_, "DelegateUpdated",
                    {{"approver", to_hex(caller)}, {"delegate", to_hex(delegate)}, {"approved", approved}});
    });
}

std::vector<uint32_t> SimulatedComptroller::enter_markets(const Address& caller, const std::vector<Address>& markets) {
    return chain_.transact([&] {
        std::vector<uint32_t> results;
        results.reserve(markets.size());
        for (const auto& market : markets) results.push_back(enter_market_behalf(caller, caller, market));
        return results;
    });
}

uint32_t SimulatedComptroller::mint(const Address& caller, const Address& market, const U256& amount) {
    return mint_behalf(caller, caller, market, amount);
}

uint32_t SimulatedComptroller::borrow(const Address& caller, const Address& market, const U256& amount) {
    return borrow_behalf(caller, caller, market, amount);
}

uint32_t SimulatedComptroller::repay_borrow(const Address& caller, const Address& market, const U256& amount) {
    return repay_borrow_behalf(caller, caller, market, amount);
}

uint32_t SimulatedComptroller::redeem_underlying(const Address& caller, const Address& market, const U256& amount) {
    return redeem_underlying_behalf(caller, caller, market, amount);
}

// =============================================================================
// Market Views
// =============================================================================

U256 SimulatedComptroller::get_cash(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? U256(0) : cash(*record, market);
    });
}

U256 SimulatedComptroller::total_borrows(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? U256(0) : record->total_borrows;
    });
}

U256 SimulatedComptroller::total_reserves(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? U256(0) : record->total_reserves;
    });
}

U256 SimulatedComptroller::balance_of(const Address& market, const Address& account) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        if (record == nullptr) return U256(0);
        auto it = record->accounts.find(account);
        return it == record->accounts.end() ? U256(0) : it->second.shares;
    });
}

std::optional<U256> SimulatedComptroller::supply_cap(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? std::optional<U256>{} : record->supply_cap;
    });
}

std::optional<U256> SimulatedComptroller::borrow_cap(const Address& market) const {
    return chain_.read([&] {
        const MarketRecord* record = find_market(market);
        return record == nullptr ? std::optional<U256>{} : record->borrow_cap;
    });
}

bool SimulatedComptroller::is_flash_loan_whitelisted(const Address& account) const {
    return chain_.read([&] { return state_.get().flash_loan_whitelist.count(account) != 0; });
}

bool SimulatedComptroller::is_whitelisted_executor(const Address& account) const {
    return chain_.read([&] { return state_.get().executors.count(account) != 0; });
}

} // namespace lever
