#include "SmoteEnn.h"
#include "Validation.h"

namespace {
SmoteOptions smoteStage(const SmoteEnnOptions& o) {
    SmoteOptions s;
    s.k = o.k;
    s.m = o.m;
    s.outStep = o.outStep;
    s.kind = o.kindSmote;
    s.nnMethod = o.nnMethod;
    s.nJobs = o.nJobs;
    s.svmC = o.svmC;
    s.svmEpochs = o.svmEpochs;
    return s;
}

EnnOptions ennStage(const SmoteEnnOptions& o) {
    EnnOptions e;
    e.sizeNgh = o.sizeNgh;
    e.kindSel = o.kindEnn;
    e.nJobs = o.nJobs;
    return e;
}

// The cleaning stage takes no ratio.
SamplerParams ennParams(const SamplerParams& p) {
    SamplerParams e;
    e.randomState = p.randomState;
    e.verbose = p.verbose;
    return e;
}
}

SmoteEnn::SmoteEnn(SamplerParams params, SmoteEnnOptions options)
    : Sampler(params),
      smote_(params, smoteStage(options)),
      enn_(ennParams(params), ennStage(options)) {}

SmoteEnn& SmoteEnn::fit(const FeatureMatrix& X, const Labels& y) {
    Validation::checkXY(X, y);
    Sampler::fit(X, y);
    smote_.fit(X, y);
    return *this;
}

Resampled SmoteEnn::transform(const FeatureMatrix& X, const Labels& y) {
    Validation::checkXY(X, y);
    checkTransformInput(X);

    const Resampled oversampled = smote_.transform(X, y);
    return enn_.fitTransform(oversampled.first, oversampled.second);
}
