#include "gnmireverse/client/subscriber.h"
#include "gnmireverse/common/logger.h"

#include <grpcpp/client_context.h>

namespace gnmireverse {
namespace client {

gnmi::SubscribeRequest BuildSubscribeRequest(const std::string& target_value,
                                             const std::vector<path::Path>& paths) {
    gnmi::SubscribeRequest request;
    auto* list = request.mutable_subscribe();
    list->mutable_prefix()->set_target(target_value);
    for (const auto& p : paths) {
        auto* subscription = list->add_subscription();
        p.ToProto(subscription->mutable_path());
        subscription->set_mode(gnmi::SubscriptionMode::TARGET_DEFINED);
    }
    return request;
}

Subscriber::Subscriber(std::shared_ptr<grpc::ChannelInterface> target_channel,
                       SubscribeOptions options)
    : stub_(gnmi::gNMI::NewStub(target_channel))
    , options_(std::move(options)) {}

core::Result<void> Subscriber::Run(core::CancellationScope& scope, UpdateChannel& channel) {
    const gnmi::SubscribeRequest request =
        BuildSubscribeRequest(options_.target_value, options_.paths);

    grpc::ClientContext context;
    if (!options_.username.empty()) {
        context.AddMetadata("username", options_.username);
        context.AddMetadata("password", options_.password);
    }
    core::ScopedCancelCallback cancel_call(scope, [&context]() { context.TryCancel(); });

    auto cancelled = [&scope]() {
        return core::Result<void>::from_error(core::CancellationError(scope.Reason()));
    };

    auto stream = stub_->Subscribe(&context);
    if (!stream) {
        return core::Result<void>::from_error(core::StreamError("error from Subscribe: no stream"));
    }

    if (!stream->Write(request)) {
        grpc::Status status = stream->Finish();
        if (scope.IsCancelled()) {
            return cancelled();
        }
        return core::Result<void>::from_error(
            core::StreamError("error sending SubscribeRequest: " + FormatStatus(status)));
    }
    GNMIREVERSE_DEBUG("subscribed to {} path(s) on target \"{}\"",
                      options_.paths.size(), options_.target_value);

    for (;;) {
        auto response = std::make_unique<gnmi::SubscribeResponse>();
        if (!stream->Read(response.get())) {
            grpc::Status status = stream->Finish();
            if (scope.IsCancelled()) {
                return cancelled();
            }
            if (status.ok()) {
                return core::Result<void>::from_error(
                    core::StreamError("error from Subscribe.Recv: target closed the stream"));
            }
            return core::Result<void>::from_error(
                core::StreamError("error from Subscribe.Recv: " + FormatStatus(status)));
        }

        auto sent = channel.Send(std::move(response));
        if (!sent.ok()) {
            context.TryCancel();
            grpc::Status status = stream->Finish();
            GNMIREVERSE_DEBUG("subscribe stream finished after cancellation: {}",
                              FormatStatus(status));
            return sent;
        }
    }
}

} // namespace client
} // namespace gnmireverse
