#pragma once

// 표준 라이브러리
#include <optional>
#include <string>

// 외부 라이브러리
#include <nlohmann/json_fwd.hpp>

// 네임스페이스
using namespace std;
using namespace nlohmann;

/// 데이터 핸들링을 위한 유틸리티 네임스페이스
namespace rolling_stdev::utils {

/// 값을 주어진 정밀도의 string으로 변환하여 반환하는 함수
[[nodiscard]] string ToFixedString(double value, int precision);

/// 두 값의 차이가 허용 상대 오차 이내인지 반환하는 함수.
/// 기준 값의 절댓값이 1보다 작으면 절대 오차로 비교함.
[[nodiscard]] bool IsNearlyEqual(double value, double reference,
                                 double relative_tolerance);

/// 표준 편차 값을 로그용 문자열로 변환하여 반환하는 함수.
/// 값이 없으면 "N/A"를 반환함.
[[nodiscard]] string FormatStdev(const optional<double>& stdev);

/// 주어진 Json에서 주어진 키를 찾고 Double로 반환하는 함수.
/// 숫자형과 숫자 문자열 모두 허용함.
[[nodiscard]] double GetDoubleFromJson(const json& data, const string& key);

/// 지정된 경로의 Json 파일을 읽어 반환하는 함수
[[nodiscard]] json ReadJsonFile(const string& file_path);

}  // namespace rolling_stdev::utils
