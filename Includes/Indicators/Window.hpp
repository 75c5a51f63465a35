#pragma once

// 표준 라이브러리
#include <optional>
#include <vector>

// 네임 스페이스
using namespace std;

namespace rolling_stdev::indicator {

/**
 * 한 엔티티, 한 필드의 최근 N개 값을 보관하는 고정 크기 슬라이딩 윈도우
 *
 * 윈도우 안의 기준 값으로부터의 편차 합과 편차 제곱합을 보정 합산으로 증분
 * 갱신하여 값 추가 시 분할 상환 O(1)로 모표준편차를 계산함.\n
 * 기준 값이 윈도우에서 제거될 때마다 최신 값을 새 기준으로 삼아 합을 버퍼로부터
 * 다시 계산하므로 제거된 값의 반올림 오차가 누적되지 않음.
 */
class Window final {
 public:
  explicit Window(size_t capacity);

  /**
   * 저장된 값들로부터 윈도우를 복원하는 함수
   *
   * 합과 제곱합은 값들로부터 새로 계산함.
   * @param capacity 윈도우 크기
   * @param values 오래된 값부터 최신 값 순서의 값들
   */
  [[nodiscard]] static Window Restore(size_t capacity,
                                      const vector<double>& values);

  /// 값을 추가하는 함수. 윈도우가 가득 찼으면 가장 오래된 값을 제거함.
  void Push(double value);

  /// 모표준편차를 반환하는 함수. 값이 없으면 nullopt를 반환.
  [[nodiscard]] optional<double> Stdev() const;

  /// 모든 값과 합, 제곱합을 초기화하는 함수
  void Reset();

  /// 보관 중인 값들을 오래된 값부터 최신 값 순서로 반환하는 함수
  [[nodiscard]] vector<double> GetValues() const;

  [[nodiscard]] size_t GetCount() const;
  [[nodiscard]] size_t GetCapacity() const;
  [[nodiscard]] bool IsEmpty() const;

  /// 보관 중인 값들의 합을 오래된 값부터 합산하여 반환하는 함수
  [[nodiscard]] double GetSum() const;

  /// 보관 중인 값들의 제곱합을 오래된 값부터 합산하여 반환하는 함수
  [[nodiscard]] double GetSumSq() const;

 private:
  /// 더하고 빼는 항의 반올림 오차를 별도로 누적하는 Neumaier 보정 합
  struct CompensatedSum {
    long double sum = 0.0L;
    long double compensation = 0.0L;

    void Add(long double term);
    [[nodiscard]] long double Value() const;
  };

  size_t capacity_;

  // 원형 버퍼
  vector<double> buffer_;
  size_t head_;   // 가장 오래된 값의 인덱스
  size_t count_;  // 보관 중인 값의 개수

  // 편차 기준 값과 그 값이 들어있는 버퍼 인덱스.
  // 윈도우가 비어있지 않으면 기준 값은 항상 윈도우 안의 값임.
  long double anchor_;
  size_t anchor_index_;

  CompensatedSum deviation_sum_;     // (x - anchor_)의 합
  CompensatedSum deviation_sum_sq_;  // (x - anchor_)²의 합

  // 최신 값과 같은 값이 끝에서부터 연속된 개수.
  // count_와 같으면 윈도우 내 모든 값이 동일함.
  size_t equal_run_;

  /// newest_index의 값을 새 기준으로 삼고 편차 합을 버퍼로부터 다시 계산하는
  /// 함수
  void Rebase(size_t newest_index);
};

}  // namespace rolling_stdev::indicator
