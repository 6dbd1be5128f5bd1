#pragma once

// shapeforge/event_stream_models.hpp: the event-stream fixture model and one
// test case per protocol with a text payload codec.
//
// The fixture (namespace "test") binds TestService to one protocol and
// defines TestStreamOp, whose input and output stream the TestStream union:
//
//   MessageWithBlob                  @eventPayload blob
//   MessageWithString                @eventPayload string
//   MessageWithStruct                @eventPayload TestStruct
//   MessageWithUnion                 @eventPayload TestUnion
//   MessageWithHeaders               @eventHeader blob/boolean/int/long/string
//   MessageWithHeaderAndPayload      @eventHeader string + @eventPayload blob
//   MessageWithNoHeaderPayloadTraits plain members, encoded as the payload
//   SomeError                        modeled error
//
// Payload literals follow member order, which is the sorted key order of the
// model document.

#include <string>
#include <vector>

#include "shapeforge/model.hpp"

namespace shapeforge {

enum class PayloadFormat { json, xml };

// Throws Error(unsupported_shape) for protocols without a text codec (CBOR).
PayloadFormat payload_format(Protocol protocol);

struct EventStreamTestCase {
  std::string protocol_shape_id;  // "aws.protocols#restJson1"
  Protocol protocol;
  Model model;
  std::string media_type;  // content type of structured payloads
  std::string request_content_type;
  std::string response_content_type;
  std::string valid_test_struct;
  std::string valid_message_with_no_header_payload_traits;
  std::string valid_test_union;
  std::string valid_some_error;
  std::string valid_unmodeled_error;

  const std::string& to_string() const { return protocol_shape_id; }
};

// JSON AST text of the fixture with `protocol` on TestService.
std::string event_stream_model_json(Protocol protocol);
Model event_stream_model(Protocol protocol);

// restJson1, awsJson1_0, awsJson1_1 and restXml.
const std::vector<EventStreamTestCase>& event_stream_test_cases();

}  // namespace shapeforge
