#ifndef RESULTWRITER_HH
#define RESULTWRITER_HH

#include "AnalysisService.hh"

#include <ostream>
#include <string>
#include <json/json.h>

// JSON payloads of the four operations. Missing values become null.
class ResultWriter {
public:
    static Json::Value Number(double x);
    static Json::Value ToJson(const ItemParameter & param);
    static Json::Value ToJson(const AnalysisResult & result);
    static Json::Value ToJson(const ItemCurveSet & set);
    static Json::Value ToJson(const ItemInformationSet & set);
    static Json::Value ToJson(const TestInformationResult & result);

    // {status: "error", error: message, kind: ...}
    static Json::Value ErrorPayload(const std::string & message, const std::string & kind = "");
    static Json::Value ErrorPayload(const std::exception & e);

    static void Write(const Json::Value & payload, std::ostream & out);
};

#endif // RESULTWRITER_HH
