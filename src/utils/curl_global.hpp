#ifndef DLQUEUE_CURL_GLOBAL_HPP_
#define DLQUEUE_CURL_GLOBAL_HPP_

namespace dlqueue {
namespace utils {

// curl_global_init 只能调用一次且不是线程安全的，所有使用 libcurl 的代码
// 在创建 easy/multi 句柄前先调用这里。失败时抛出 std::runtime_error。
void ensureCurlInitialized();

}  // namespace utils
}  // namespace dlqueue

#endif  // DLQUEUE_CURL_GLOBAL_HPP_
