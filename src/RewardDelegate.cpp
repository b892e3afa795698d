#include "RewardDelegate.hpp"
#include "CryptoUtils.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace candle {

    SubjectDescriptor SubjectDescriptor::forCollection() {
        return SubjectDescriptor{Subject::AssetCollection, {}};
    }

    SubjectDescriptor SubjectDescriptor::forDomain(const string& domainName) {
        if (domainName.empty()) {
            throw invalid_argument("Domain name must not be empty");
        }
        return SubjectDescriptor{Subject::NamedDomain, CryptoUtils::sha256Bytes(domainName)};
    }

    ContractRewardDelegate::ContractRewardDelegate(const AccountId& rewardContract, CallTransport transport)
        : rewardContract(rewardContract), transport(move(transport)) {
        if (!CryptoUtils::isValidAddress(rewardContract)) {
            throw invalid_argument("Invalid reward contract address: " + rewardContract);
        }
        if (!this->transport) {
            throw invalid_argument("Reward delegate needs a call transport");
        }
    }

    RewardCall ContractRewardDelegate::buildCall(const AccountId& winner, const SubjectDescriptor& subject) const {
        RewardCall call;
        call.callee = rewardContract;

        switch (subject.subject) {
            case Subject::AssetCollection:
                call.selector = SELECTOR_SET_APPROVAL_FOR_ALL;
                call.payload = encodeApprovalArgs(winner, true);
                break;
            case Subject::NamedDomain:
                call.selector = SELECTOR_TRANSFER_DOMAIN;
                call.payload = encodeDomainTransferArgs(subject.domainHash, winner);
                break;
            default:
                throw invalid_argument("No reward method for subject " + subjectToString(subject.subject));
        }
        return call;
    }

    bool ContractRewardDelegate::grant(const AccountId& winner, const SubjectDescriptor& subject) {
        vector<uint8_t> frame;
        try {
            frame = serializeRewardCall(buildCall(winner, subject));
        } catch (const exception& e) {
            cerr << "Error: cannot encode reward call: " << e.what() << endl;
            return false;
        }

        if (!transport(frame)) {
            cerr << "Error: reward contract " << rewardContract << " rejected "
                 << subjectToString(subject.subject) << " grant to " << winner << endl;
            return false;
        }

        cout << "Reward contract " << rewardContract << " granted "
             << subjectToString(subject.subject) << " to " << winner << endl;
        return true;
    }

} // namespace candle
