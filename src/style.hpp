#pragma once
/*
 * Style
 *
 * Purpose: semantic styles for UI chrome and rendered note text.
 * Note: terminals map these to attributes/colors; frame composition never sees colors.
 */

enum class Style {
  Normal,
  Title,
  Muted,
  Selected,
  SelectedMuted,
  Border,
  Heading,
  Code,
  Quote,
  Strong,
  Emphasis,
  Error,
  Status,
};
