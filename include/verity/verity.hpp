#pragma once
#include "value.hpp"
#include "error.hpp"
#include "rule.hpp"
#include "violation.hpp"
#include "errors.hpp"
#include "check.hpp"
#include "composition.hpp"
#include "node.hpp"
#include "walker.hpp"
#include "message.hpp"
#include "bridge/schema_document.hpp"
#include "bridge/serialized.hpp"
