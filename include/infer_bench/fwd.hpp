#pragma once

namespace infer_bench {

struct TrialConfig;
struct TrialResult;
struct RequestOutcome;
struct ResourceSample;
struct ProbeReading;
struct BenchConfig;

class CancelToken;
class RequestIssuer;
class ResourceProbe;
class ResultSink;
class Aggregator;
class ResourceSampler;
class WorkloadGenerator;
class TrialController;
class BenchConfigLoader;

}
