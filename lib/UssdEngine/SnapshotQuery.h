/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/SnapshotQuery.h
 *
 * Description:
 * Depth-first lookups over a Snapshot. Actuator implementations delegate to
 * these so that every platform binding resolves controls the same way.
 * =================================================================================
 */
#pragma once
#include <string>
#include <vector>

#include "Snapshot.h"
#include "TextUtils.h"

class SnapshotQuery {
public:
    /**
     * Collects every non-blank text value in traversal order.
     * Input fields are skipped: their content is our own typing, not a turn.
     */
    static void collectText(const SnapshotNode& node, std::vector<std::string>& out) {
        if (!isInputField(node) && !TextUtils::isBlank(node.text)) {
            out.push_back(node.text);
        }
        for (size_t i = 0; i < node.children.size(); i++) {
            collectText(node.children[i], out);
        }
    }

    /**
     * First editable node (or EditText-class node).
     */
    static bool isInputField(const SnapshotNode& node) {
        return node.editable || TextUtils::contains(node.className, "EditText");
    }

    static const SnapshotNode* findInputField(const SnapshotNode& node) {
        if (isInputField(node)) {
            return &node;
        }
        for (size_t i = 0; i < node.children.size(); i++) {
            const SnapshotNode* found = findInputField(node.children[i]);
            if (found) return found;
        }
        return nullptr;
    }

    /**
     * First clickable node whose text or content description equals one of
     * 'labels' (case-insensitive).
     */
    static const SnapshotNode* findControlByLabel(const SnapshotNode& node,
                                                  const char* const* labels,
                                                  size_t labelCount) {
        if (node.clickable) {
            for (size_t i = 0; i < labelCount; i++) {
                if (TextUtils::equalsIgnoreCase(node.text, labels[i]) ||
                    TextUtils::equalsIgnoreCase(node.contentDescription, labels[i])) {
                    return &node;
                }
            }
        }
        for (size_t i = 0; i < node.children.size(); i++) {
            const SnapshotNode* found = findControlByLabel(node.children[i], labels, labelCount);
            if (found) return found;
        }
        return nullptr;
    }
};
