#pragma once
#include <ArduinoJson.h>
#include <string.h>
#include <string>

#include "Types.h"

// Stored user profile. Field names on disk follow the app's credential store.
struct UserCredentials {
    std::string upiPin;
    std::string mobileNumber;
    std::string bankName;
    std::string bankIfsc;
    std::string cardLastSix;
    std::string cardExpiryMonth;
    std::string cardExpiryYear;
    bool isSetupComplete;

    UserCredentials() : isSetupComplete(false) {}

    // last six digits + MM + YY, as the network expects it
    std::string formattedCardDetails() const {
        return cardLastSix + cardExpiryMonth + cardExpiryYear;
    }

    BankSecrets toSecrets() const {
        BankSecrets secrets;
        secrets.bankIfsc = bankIfsc;
        secrets.bankName = bankName;
        secrets.cardDetails = formattedCardDetails();
        secrets.upiPin = upiPin;
        return secrets;
    }
};

// One user intent, as handed over by the application layer.
struct TransferRequest {
    OperationKind kind;
    std::string recipient;
    double amount;
    std::string remarks;

    TransferRequest() : kind(OP_BALANCE_CHECK), amount(0.0) {}
};

class ConfigValidators {
public:
    // Missing keys keep the value from 'defaults'. Out-of-range values are rejected.
    // Returns true if valid. Populates outTimings.
    static bool parseEngineTimings(const JsonVariant& json, const EngineTimings& defaults,
                                   EngineTimings& outTimings, std::string& errorMsg);
    static void writeEngineTimings(const EngineTimings& timings, JsonObject out);

    static bool parseCredentials(const JsonVariant& json, UserCredentials& outCreds, std::string& errorMsg);
    static void writeCredentials(const UserCredentials& creds, JsonObject out);

    // Field-level checks (PIN, mobile, IFSC, card). Writes explanation to errorMsg.
    static bool validateCredentials(const UserCredentials& creds, std::string& errorMsg);

    static bool parseTransferRequest(const JsonVariant& json, TransferRequest& outRequest, std::string& errorMsg);
    static bool validateTransfer(const TransferRequest& request, std::string& errorMsg);

    static bool isValidMobile(const std::string& mobile);
    static bool isValidVpa(const std::string& vpa);

    static const char* operationName(OperationKind kind);
    static bool parseOperationName(const std::string& name, OperationKind& outKind);
};
