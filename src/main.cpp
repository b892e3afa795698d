#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <set>

#include "AuctionStateMachine.hpp"
#include "CryptoUtils.hpp"
#include "EntropySource.hpp"
#include "FundsTransfer.hpp"
#include "RewardDelegate.hpp"

using namespace std;
using namespace candle;

struct ScriptedBid {
    Tick block;
    AccountId bidder;
    Balance amount;
};

// Los pujadores pueden darse como direccion o como etiqueta ("alice")
static AccountId resolveAccount(const string& token) {
    if (CryptoUtils::isValidAddress(token)) {
        return CryptoUtils::normalizeAddress(token);
    }
    return CryptoUtils::addressFromMaterial(token);
}

static bool loadBidScript(const string& filename, vector<ScriptedBid>& bids) {
    ifstream file(filename);
    if (!file) {
        cerr << "Error: Cannot open bid script: " << filename << endl;
        return false;
    }

    string line;
    size_t lineNumber = 0;
    while (getline(file, line)) {
        ++lineNumber;
        if (line.empty() || line[0] == '#') continue;

        istringstream in(line);
        ScriptedBid bid;
        string bidder;
        if (!(in >> bid.block >> bidder >> bid.amount)) {
            cerr << "Error: malformed bid at line " << lineNumber << ": " << line << endl;
            return false;
        }
        bid.bidder = resolveAccount(bidder);
        bids.push_back(bid);
    }
    return true;
}

int main(int argc, char** argv) {
    ios::sync_with_stdio(false);

    if (argc < 2) {
        cerr << "usage: " << argv[0] << " <bids-file> [opening] [ending] [rf_delay] [seed-hex]" << endl;
        return 1;
    }

    string bidsFile = argv[1];
    AuctionConfig config;
    config.startTime = 1;
    config.openingDuration = 5;
    config.endingDuration = 5;
    config.rfDelay = DEFAULT_RF_DELAY;

    try {
        if (argc > 2) config.openingDuration = stoull(argv[2]);
        if (argc > 3) config.endingDuration = stoull(argv[3]);
        if (argc > 4) config.rfDelay = stoull(argv[4]);
    } catch (const exception& e) {
        cerr << "Invalid numeric argument: " << e.what() << endl;
        return 1;
    }

    if (!CryptoUtils::initialize()) {
        cerr << "Failed to initialize crypto (sodium)." << endl;
        return 1;
    }

    vector<uint8_t> seed;
    try {
        seed = argc > 5 ? CryptoUtils::hexDecode(argv[5]) : SeededEntropySource::generateSeed();
    } catch (const exception& e) {
        cerr << "Invalid seed: " << e.what() << endl;
        return 1;
    }

    vector<ScriptedBid> bids;
    if (!loadBidScript(bidsFile, bids)) {
        return 1;
    }

    config.owner = CryptoUtils::addressFromMaterial("owner");
    config.rewardContract = CryptoUtils::addressFromMaterial("reward-contract");

    cout << "Candle auction simulator. opening=" << config.openingDuration
         << " ending=" << config.endingDuration << " rf_delay=" << config.rfDelay
         << " bids=" << bids.size() << endl;

    try {
        SeededEntropySource entropy(seed);
        EscrowAccount escrow;
        ContractRewardDelegate reward(config.rewardContract, [](const vector<uint8_t>& frame) {
            RewardCall call;
            if (!parseRewardCall(frame, call)) return false;
            cout << "-> " << selectorToString(call.selector) << " on " << call.callee
                 << " (" << frame.size() << " bytes)" << endl;
            return true;
        });

        AuctionStateMachine auction(config, 0, entropy, reward, escrow);
        set<AccountId> participants;

        for (const auto& bid : bids) {
            entropy.observeBlock(bid.block);
            try {
                auction.placeBid(bid.bidder, bid.amount, bid.block);
                participants.insert(bid.bidder);
                if (!escrow.deposit(bid.amount)) {
                    cerr << "Warning: escrow could not take " << bid.amount << " from " << bid.bidder << endl;
                }
            } catch (const AuctionException& e) {
                cerr << "Bid rejected at block " << bid.block << ": " << e.what() << endl;
            }
        }

        Tick finalizeAt = auction.config().randomnessReadyAt();
        entropy.observeBlock(finalizeAt);
        WinnerRecord record = auction.finalize(finalizeAt);

        participants.insert(auction.config().owner);
        for (const auto& account : participants) {
            PayoutReceipt receipt = auction.payout(account, finalizeAt);
            cout << "payout " << account << (account == auction.config().owner ? " (owner)" : "")
                 << ": prize=" << (receipt.prizeGranted ? "yes" : "no")
                 << " refund=" << receipt.refund << " proceeds=" << receipt.proceeds << endl;
        }

        cout << "Winner: " << record.winner.value_or("none") << " amount=" << record.winningAmount
             << " sample=" << record.winningSample << " escrow left=" << escrow.balance() << endl;
    } catch (const exception& e) {
        cerr << "Simulation failed: " << e.what() << endl;
        return 1;
    }

    return 0;
}
