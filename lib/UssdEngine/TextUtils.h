/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/TextUtils.h
 *
 * Description:
 * Pure string helpers shared by the classifier, planner and extractor.
 * Header-only so they can be used by the host and by native tests alike.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <string.h>
#include <string>

class TextUtils {
public:
    static std::string toLower(const std::string& s) {
        std::string out(s);
        for (size_t i = 0; i < out.size(); i++) {
            char c = out[i];
            if (c >= 'A' && c <= 'Z') out[i] = (char)(c - 'A' + 'a');
        }
        return out;
    }

    static std::string toUpper(const std::string& s) {
        std::string out(s);
        for (size_t i = 0; i < out.size(); i++) {
            char c = out[i];
            if (c >= 'a' && c <= 'z') out[i] = (char)(c - 'a' + 'A');
        }
        return out;
    }

    static bool isSpace(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    static std::string trim(const std::string& s) {
        size_t start = 0;
        size_t end = s.size();
        while (start < end && isSpace(s[start])) start++;
        while (end > start && isSpace(s[end - 1])) end--;
        return s.substr(start, end - start);
    }

    static bool isBlank(const std::string& s) {
        for (size_t i = 0; i < s.size(); i++) {
            if (!isSpace(s[i])) return false;
        }
        return true;
    }

    static bool isAllDigits(const std::string& s) {
        if (s.empty()) return false;
        for (size_t i = 0; i < s.size(); i++) {
            if (!isDigit(s[i])) return false;
        }
        return true;
    }

    static bool equalsIgnoreCase(const std::string& a, const char* b) {
        size_t len = strlen(b);
        if (a.size() != len) return false;
        for (size_t i = 0; i < len; i++) {
            char x = a[i];
            char y = b[i];
            if (x >= 'A' && x <= 'Z') x = (char)(x - 'A' + 'a');
            if (y >= 'A' && y <= 'Z') y = (char)(y - 'A' + 'a');
            if (x != y) return false;
        }
        return true;
    }

    static bool contains(const std::string& haystack, const char* needle) {
        return haystack.find(needle) != std::string::npos;
    }

    /**
     * True if 'lowerText' contains any of the NULL-terminated keyword list.
     * Keywords must already be lower case.
     */
    static bool containsAny(const std::string& lowerText, const char* const* keywords) {
        for (size_t i = 0; keywords[i] != NULL; i++) {
            if (lowerText.find(keywords[i]) != std::string::npos) return true;
        }
        return false;
    }

    /**
     * 32-bit FNV-1a over the raw bytes. Used as the turn fingerprint.
     * Never returns 0 so that 0 can mean "no turn".
     */
    static uint32_t fingerprint(const std::string& s) {
        uint32_t hash = 2166136261u;
        for (size_t i = 0; i < s.size(); i++) {
            hash ^= (uint8_t)s[i];
            hash *= 16777619u;
        }
        return hash == 0 ? 1u : hash;
    }

    /**
     * Replaces all but the last 'visible' characters with '*'.
     */
    static std::string mask(const std::string& s, size_t visible) {
        if (s.size() <= visible) return std::string(s.size(), '*');
        return std::string(s.size() - visible, '*') + s.substr(s.size() - visible);
    }

    /**
     * Cuts to 'maxLen' characters, appending "..." when shortened.
     */
    // Never splits a UTF-8 sequence, so the result can come out shorter than maxLen.
    static std::string truncate(const std::string& s, size_t maxLen) {
        if (s.size() <= maxLen) return s;
        if (maxLen <= 3) return s.substr(0, utf8Boundary(s, maxLen));
        return s.substr(0, utf8Boundary(s, maxLen - 3)) + "...";
    }

    static size_t utf8Boundary(const std::string& s, size_t cut) {
        while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
        return cut;
    }

    /**
     * Replaces newlines with " | " for single-line log output.
     */
    static std::string flatten(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); i++) {
            if (s[i] == '\n') out += " | ";
            else if (s[i] != '\r') out += s[i];
        }
        return out;
    }
};
