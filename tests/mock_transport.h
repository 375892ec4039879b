#pragma once

#include <gmock/gmock.h>

#include "transfer.h"

class MockTransport : public Transport {
public:
    MOCK_METHOD(RawFrame, exchange, (const RawFrame& request, unsigned int timeout_ms),
                (override));
};
