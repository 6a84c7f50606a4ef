#pragma once

namespace clearledger::tests {

void test_telemetry_sink();
void test_telemetry_sink_stays_bounded();

}  // namespace clearledger::tests
