#include "AuctionStateMachine.hpp"
#include "CryptoUtils.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>

namespace candle {

    namespace {
        SubjectDescriptor describeSubject(const AuctionConfig& config) {
            if (config.subject == Subject::NamedDomain) {
                return SubjectDescriptor::forDomain(config.domainName);
            }
            return SubjectDescriptor::forCollection();
        }
    }

    AuctionStateMachine::AuctionStateMachine(const AuctionConfig& config, Tick createdAt,
                                             EntropySource& entropy, RewardDelegate& reward, FundsTransfer& funds)
        : settings(resolveConfig(config, createdAt)),
          descriptor(describeSubject(settings)),
          entropy(entropy),
          reward(reward),
          funds(funds),
          history(settings.endingDuration) {}

    // -----------------------------------------------------------------------------------
    // ---------------------------- HELPERS ----------------------------------------------
    // -----------------------------------------------------------------------------------

    AccountId AuctionStateMachine::checkedAccount(const AccountId& account) const {
        if (!CryptoUtils::isValidAddress(account)) {
            throw AuctionException(AuctionError::InvalidAccount, "malformed account '" + account + "'");
        }
        return CryptoUtils::normalizeAddress(account);
    }

    void AuctionStateMachine::checkCallOrder(Tick currentTime) const {
        if (lastCallAt && currentTime < *lastCallAt) {
            throw AuctionException(AuctionError::OutOfOrderCall,
                "block " + to_string(currentTime) + " precedes last applied call at " + to_string(*lastCallAt));
        }
    }

    void AuctionStateMachine::emit(EventType type, Tick block, optional<AccountId> account, Balance amount,
                                   optional<Sample> sample) {
        AuctionEvent event;
        event.type = type;
        event.block = block;
        event.account = move(account);
        event.amount = amount;
        event.sample = sample;
        journal.push_back(event);

        if (verbose) {
            cout << "[auction] " << describeEvent(event) << endl;
        }
    }

    bool AuctionStateMachine::grantPrize(const AccountId& to) {
        try {
            return reward.grant(to, descriptor);
        } catch (const exception& e) {
            cerr << "Error: reward delegate threw while granting to " << to << ": " << e.what() << endl;
            return false;
        }
    }

    bool AuctionStateMachine::releaseFunds(const AccountId& to, Balance amount) {
        try {
            return funds.transfer(to, amount);
        } catch (const exception& e) {
            cerr << "Error: funds transfer threw while paying " << amount << " to " << to << ": " << e.what() << endl;
            return false;
        }
    }

    // -----------------------------------------------------------------------------------
    // ---------------------------- COMANDOS ---------------------------------------------
    // -----------------------------------------------------------------------------------

    Balance AuctionStateMachine::placeBid(const AccountId& bidder, Balance amount, Tick currentTime) {
        Phase phase = getStatus(currentTime);
        if (phase != Phase::Opening && phase != Phase::Ending) {
            throw AuctionException(AuctionError::NotInBiddingPhase,
                "auction is " + phaseToString(phase) + " at block " + to_string(currentTime));
        }
        if (amount == 0) {
            throw AuctionException(AuctionError::ZeroAmount, "bid must transfer a positive amount");
        }

        AccountId account = checkedAccount(bidder);
        checkCallOrder(currentTime);

        optional<Balance> total = ledger.projected(account, amount);
        if (!total) {
            throw AuctionException(AuctionError::Overflow,
                "balance of " + account + " cannot grow by " + to_string(amount));
        }

        // Todas las validaciones pasaron: aplicar la puja
        optional<Sample> sample = currentSample(currentTime);
        if (sample) {
            history.record(*sample, account, *total);
        }
        ledger.increment(account, amount);
        lastCallAt = currentTime;

        emit(EventType::BID_PLACED, currentTime, account, *total, sample);
        return *total;
    }

    WinnerRecord AuctionStateMachine::finalize(Tick currentTime) {
        if (winner) {
            throw AuctionException(AuctionError::AlreadyFinalized,
                "winner already drawn at sample " + to_string(winner->winningSample));
        }
        if (currentTime < settings.randomnessReadyAt()) {
            throw AuctionException(AuctionError::RandomnessNotReady,
                "randomness available from block " + to_string(settings.randomnessReadyAt())
                + ", now " + to_string(currentTime));
        }
        checkCallOrder(currentTime);

        uint64_t random = 0;
        bool ready = false;
        try {
            ready = entropy.random(settings.endingEnd(), random);
        } catch (const exception& e) {
            cerr << "Error: entropy source failed: " << e.what() << endl;
        }
        if (!ready) {
            throw AuctionException(AuctionError::RandomnessNotReady,
                "entropy source has no randomness for block " + to_string(settings.endingEnd()));
        }

        WinnerRecord record;
        record.winningSample = random % settings.endingDuration;
        SampleSlot slot = history.leaderAt(record.winningSample);
        record.winner = slot.leader;
        record.winningAmount = slot.leader ? slot.amount : 0;

        // Completar el historial: los bloques sin pujas heredan el lider anterior
        history.extendThrough(settings.endingDuration - 1);
        winner = record;
        lastCallAt = currentTime;

        emit(EventType::AUCTION_FINALIZED, currentTime, record.winner, record.winningAmount, record.winningSample);
        if (verbose) {
            cout << "Candle blown out at sample " << record.winningSample << " of " << settings.endingDuration
                 << ", winner " << record.winner.value_or("none") << endl;
        }
        return record;
    }

    PayoutReceipt AuctionStateMachine::payout(const AccountId& caller, Tick currentTime) {
        if (!winner) {
            throw AuctionException(AuctionError::NotFinalized, "no winner drawn yet, finalize the auction first");
        }

        AccountId account = checkedAccount(caller);
        PayoutRecord current = payouts.count(account) ? payouts.at(account) : PayoutRecord{};
        if (current.claimed) {
            throw AuctionException(AuctionError::AlreadyClaimed, "payout of " + account + " already settled");
        }
        checkCallOrder(currentTime);

        const bool isWinner = winner->winner && *winner->winner == account;
        const bool isOwner = winner->winner && account == settings.owner;

        Balance held = ledger.get(account);
        if (isWinner && held < winner->winningAmount) {
            throw logic_error("Winner balance " + to_string(held) + " below winning bid "
                              + to_string(winner->winningAmount));
        }

        PayoutReceipt receipt;
        receipt.account = account;
        receipt.refund = isWinner ? held - winner->winningAmount : held;
        receipt.proceeds = isOwner ? winner->winningAmount : 0;
        if (receipt.proceeds > numeric_limits<Balance>::max() - receipt.refund) {
            throw AuctionException(AuctionError::Overflow, "settlement of " + account + " does not fit a balance");
        }

        // El premio se entrega una sola vez, aunque la transferencia posterior falle
        if (isWinner && !current.prizeGranted) {
            if (!grantPrize(account)) {
                throw AuctionException(AuctionError::DelegateFailure,
                    "reward delegate refused " + subjectToString(descriptor.subject) + " for " + account);
            }
            current.prizeGranted = true;
            payouts[account] = current;
            emit(EventType::PRIZE_GRANTED, currentTime, account, winner->winningAmount);
        }
        receipt.prizeGranted = current.prizeGranted;

        Balance total = receipt.total();
        if (total > 0 && !releaseFunds(account, total)) {
            throw AuctionException(AuctionError::TransferFailure,
                "could not release " + to_string(total) + " to " + account);
        }

        ledger.settle(account);
        current.claimed = true;
        payouts[account] = current;
        lastCallAt = currentTime;

        if (total > 0) {
            emit(EventType::FUNDS_RELEASED, currentTime, account, total);
        }
        return receipt;
    }

    // -----------------------------------------------------------------------------------
    // ---------------------------- CONSULTAS --------------------------------------------
    // -----------------------------------------------------------------------------------

    Phase AuctionStateMachine::getStatus(Tick currentTime) const {
        if (winner) return Phase::Ended;
        if (currentTime < settings.start()) return Phase::NotStarted;
        if (currentTime < settings.endingStart()) return Phase::Opening;
        if (currentTime < settings.endingEnd()) return Phase::Ending;
        return Phase::Finalizing;
    }

    optional<Sample> AuctionStateMachine::currentSample(Tick currentTime) const {
        if (getStatus(currentTime) != Phase::Ending) {
            return nullopt;
        }
        return currentTime - settings.endingStart();
    }

    pair<optional<AccountId>, Balance> AuctionStateMachine::getWinning(Tick currentTime) const {
        if (winner) {
            return {winner->winner, winner->winningAmount};
        }
        if (getStatus(currentTime) == Phase::NotStarted) {
            return {nullopt, 0};
        }

        auto top = ledger.top();
        if (!top) {
            return {nullopt, 0};
        }
        return {top->first, top->second};
    }

    optional<AccountId> AuctionStateMachine::getWinner() const {
        if (!winner) {
            return nullopt;
        }
        return winner->winner;
    }

    Balance AuctionStateMachine::balanceOf(const AccountId& account) const {
        if (!CryptoUtils::isValidAddress(account)) {
            return 0;
        }
        return ledger.get(CryptoUtils::normalizeAddress(account));
    }

    bool AuctionStateMachine::isClaimed(const AccountId& account) const {
        if (!CryptoUtils::isValidAddress(account)) {
            return false;
        }
        auto it = payouts.find(CryptoUtils::normalizeAddress(account));
        return it != payouts.end() && it->second.claimed;
    }

} // namespace candle
