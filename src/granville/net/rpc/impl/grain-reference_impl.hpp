
#pragma once

#include <type_traits>
#include <utility>

namespace granville::net {

template <typename... Args>
RpcRequest GrainReference::make_request_(int32_t method_id, std::string_view return_type_name,
                                         const Args&... args) const {
  RpcRequest request;
  request.message_id = new_guid();
  request.grain_id = grain_id_;
  request.interface_type = interface_type_;
  request.method_id = method_id;
  request.arguments = client_->serializer().serialize_arguments(args...);
  request.timeout_ms = (timeout_ms_ > 0) ? timeout_ms_ : client_->options().request_timeout_ms;
  request.target_zone_id = target_zone_id_;
  request.return_type_name = std::string{return_type_name};
  return request;
}

template <typename R, typename... Args>
async::Future<R> GrainReference::invoke(int32_t method_id, const Args&... args) const {
  return invoke_with_type_hint<R>(method_id, std::string_view{}, args...);
}

template <typename R, typename... Args>
async::Future<R> GrainReference::invoke_with_type_hint(int32_t method_id,
                                                       std::string_view return_type_name,
                                                       const Args&... args) const {
  if (method_id < 0)
    throw RpcException{Status{StatusCode::INVALID_ARGUMENT,
                              fmt::format("unknown method on {}", interface_type_)}};

  async::Promise<R> promise;
  auto future = promise.get_future();

  client_->send_request(
      make_request_(method_id, return_type_name, args...),
      [promise, serializer = client_->serializer()](Status status, RpcResponse response) {
        if (!status.ok()) {
          promise.set_exception(RpcException{std::move(status)});
          return;
        }

        auto result = serializer.template deserialize<R>(to_span_bytes(response.payload));
        if (!result) {
          promise.set_exception(RpcException{std::move(result.error())});
        } else if constexpr (std::is_void_v<R>) {
          promise.set_value();
        } else {
          promise.set_value(std::move(*result));
        }
      });

  return future;
}

template <typename... Args>
std::shared_ptr<StreamChannel> GrainReference::invoke_stream(int32_t method_id,
                                                             const Args&... args) const {
  if (method_id < 0)
    throw RpcException{Status{StatusCode::INVALID_ARGUMENT,
                              fmt::format("unknown method on {}", interface_type_)}};

  AsyncEnumerableRequest request;
  request.stream_id = new_guid();
  request.grain_id = grain_id_;
  request.interface_type = interface_type_;
  request.method_id = method_id;
  request.arguments = client_->serializer().serialize_arguments(args...);
  return client_->open_stream(std::move(request), target_zone_id_);
}

} // namespace granville::net
