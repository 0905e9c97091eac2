#pragma once
#include "toolrelay/client/session.hpp"
#include "toolrelay/client/transports.hpp"
#include "toolrelay/client/types.hpp"
#include "toolrelay/exceptions.hpp"
#include "toolrelay/llm/backend.hpp"
#include "toolrelay/llm/catalog.hpp"
#include "toolrelay/llm/conversation.hpp"
#include "toolrelay/logging.hpp"
#include "toolrelay/orchestrator.hpp"
#include "toolrelay/settings.hpp"
#include "toolrelay/shell.hpp"
#include "toolrelay/types.hpp"
#include "toolrelay/version.hpp"
