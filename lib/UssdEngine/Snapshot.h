/*
 * =================================================================================
 * Project:   USSD Pilot - USSD Session Automation Engine
 * File:      lib/UssdEngine/Snapshot.h
 *
 * Description:
 * Read-only copy of the on-screen element tree delivered by the OS
 * UI-introspection layer. Nodes are identified by 'id' so an actuator can map
 * a node back to the live element after the copy was taken.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <string>
#include <vector>

struct SnapshotNode {
  uint32_t id;
  std::string className;
  std::string text;
  std::string contentDescription;
  bool editable;
  bool clickable;
  bool focused;
  std::vector<SnapshotNode> children;

  SnapshotNode()
      : id(0), editable(false), clickable(false), focused(false) {}
};

struct Snapshot {
  std::string sourceId; // e.g. "com.android.phone"
  SnapshotNode root;
};
