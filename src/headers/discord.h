#pragma once
/**
 * Memeforge - Discord webhook logging
 */

#include "common.h"

// Send a rich embed to the configured Discord webhook
void discord_log(const string& title, const string& description, int color = 0x5865F2);

// Convenience helpers
void discord_log_error(const string& context, const string& error);
void discord_log_server_start(int port, size_t template_count);
