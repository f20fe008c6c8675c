/*
   Copyright The Overlaybd Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
#pragma once

#include <photon/common/metric-meter/metrics.h>

struct MirrorMetric {
    Metric::AddCounter requests;
    Metric::AddCounter attempts;
    Metric::AddCounter token_exchanges;
    Metric::AddCounter token_failures;
    Metric::AddCounter rate_limited;
    Metric::AddCounter retries;
    Metric::AddCounter redirects;
    Metric::AddCounter cdn_fallbacks;
    Metric::AddCounter last_resorts;
    Metric::AddCounter failures;
    Metric::AddCounter bytes;
    Metric::QPSCounter throughput;
    Metric::MaxLatencyCounter latency;
};
