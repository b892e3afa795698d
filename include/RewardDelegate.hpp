#ifndef CANDLE_REWARD_DELEGATE_HPP
#define CANDLE_REWARD_DELEGATE_HPP

#include "AuctionTypes.hpp"
#include "RewardCall.hpp"
#include <functional>
#include <vector>
#include <string>

using namespace std;

namespace candle {

    /**
     * @brief What the winner receives: the subject kind plus, for domain auctions,
     * the SHA-256 of the domain name.
     */
    struct SubjectDescriptor {
        Subject subject = Subject::AssetCollection;
        vector<uint8_t> domainHash;

        static SubjectDescriptor forCollection();
        static SubjectDescriptor forDomain(const string& domainName);
    };

    /**
     * @class RewardDelegate
     * @brief Hands the auctioned asset over to the winner.
     */
    class RewardDelegate {
    public:
        virtual ~RewardDelegate() = default;

        /**
         * @brief Transfers the prize described by `subject` to `winner`.
         * @return false if the transfer was rejected; nothing must have been granted then
         */
        virtual bool grant(const AccountId& winner, const SubjectDescriptor& subject) = 0;
    };

    /**
     * @class ContractRewardDelegate
     * @brief Grants the prize through a call to the reward contract.
     *
     * Collections are granted with set_approval_for_all(winner, true) on the whole
     * collection, domains with transfer(domain_hash, winner). The encoded call is
     * handed to the transport, which reports whether the contract accepted it.
     */
    class ContractRewardDelegate : public RewardDelegate {
    public:
        using CallTransport = function<bool(const vector<uint8_t>&)>;

        /**
         * @throws invalid_argument if the contract address is malformed or the transport is empty
         */
        ContractRewardDelegate(const AccountId& rewardContract, CallTransport transport);

        bool grant(const AccountId& winner, const SubjectDescriptor& subject) override;

        /**
         * @brief Builds the call that grant() would send.
         * @throws invalid_argument for reserved subjects or a malformed winner address
         */
        RewardCall buildCall(const AccountId& winner, const SubjectDescriptor& subject) const;

    private:
        AccountId rewardContract;
        CallTransport transport;
    };

} // namespace candle

#endif // CANDLE_REWARD_DELEGATE_HPP
