/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/BankCatalog.h
 *
 * Description:
 * Banks reachable through the *99# service, keyed by IFSC prefix.
 * =================================================================================
 */
#pragma once
#include <string>

#include "TextUtils.h"

struct BankInfo {
    const char* name;
    const char* ifscPrefix;
    const char* shortCode;
};

class BankCatalog {
public:
    static const BankInfo* all(size_t& outCount) {
        static const BankInfo BANKS[] = {
            { "State Bank of India",     "SBIN", "SBI" },
            { "HDFC Bank",               "HDFC", "HDFC" },
            { "ICICI Bank",              "ICIC", "ICICI" },
            { "Axis Bank",               "UTIB", "AXIS" },
            { "Punjab National Bank",    "PUNB", "PNB" },
            { "Bank of Baroda",          "BARB", "BOB" },
            { "Kotak Mahindra Bank",     "KKBK", "KOTAK" },
            { "Yes Bank",                "YESB", "YES" },
            { "IndusInd Bank",           "INDB", "INDUS" },
            { "Union Bank of India",     "UBIN", "UNION" },
            { "Canara Bank",             "CNRB", "CANARA" },
            { "Bank of India",           "BKID", "BOI" },
            { "IDBI Bank",               "IBKL", "IDBI" },
            { "Central Bank of India",   "CBIN", "CBI" },
            { "Indian Bank",             "IDIB", "INDIAN" },
            { "Indian Overseas Bank",    "IOBA", "IOB" },
            { "UCO Bank",                "UCBA", "UCO" },
            { "Federal Bank",            "FDRL", "FEDERAL" },
            { "South Indian Bank",       "SIBL", "SIB" },
            { "Karnataka Bank",          "KARB", "KBL" },
        };
        outCount = sizeof(BANKS) / sizeof(BANKS[0]);
        return BANKS;
    }

    // Matches on the first four characters of an IFSC, case-insensitive.
    static const BankInfo* findByIfsc(const std::string& ifsc) {
        if (ifsc.size() < 4) return nullptr;
        std::string prefix = TextUtils::toUpper(ifsc.substr(0, 4));

        size_t count = 0;
        const BankInfo* banks = all(count);
        for (size_t i = 0; i < count; i++) {
            if (prefix == banks[i].ifscPrefix) return &banks[i];
        }
        return nullptr;
    }

    static const BankInfo* findByName(const std::string& name) {
        size_t count = 0;
        const BankInfo* banks = all(count);
        for (size_t i = 0; i < count; i++) {
            if (TextUtils::equalsIgnoreCase(name, banks[i].name) ||
                TextUtils::equalsIgnoreCase(name, banks[i].shortCode)) {
                return &banks[i];
            }
        }
        return nullptr;
    }
};
