#pragma once

#include "../../src/core/logger/logger.hpp"
#include "../../src/core/types/constants.hpp"
#include "../../src/core/types/errors.hpp"
#include "../../src/engine/crawler/crawler.hpp"
#include "../../src/engine/crawler/crawler_config.hpp"
#include "../../src/engine/output/json_output.hpp"
#include "../../src/engine/retry/retry_policy.hpp"
#include "../../src/extraction/pipeline.hpp"
#include "../../src/network/http/beast_client.hpp"
#include "../../src/proxy/pool/proxy_pool.hpp"
#include "../../src/proxy/pool/proxy_source.hpp"
