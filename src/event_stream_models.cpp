#include "shapeforge/event_stream_models.hpp"

#include "shapeforge/model_loader.hpp"
#include "shapeforge/types.hpp"

namespace shapeforge {

namespace {

constexpr const char* kProtocolPlaceholder = "@PROTOCOL@";

constexpr const char* kEventStreamModel = R"({
  "smithy": "2.0",
  "shapes": {
    "test#TestService": {
      "type": "service",
      "version": "123",
      "operations": [{"target": "test#TestStreamOp"}],
      "traits": {"@PROTOCOL@": {}}
    },
    "test#TestStreamOp": {
      "type": "operation",
      "input": {"target": "test#TestStreamInputOutput"},
      "output": {"target": "test#TestStreamInputOutput"},
      "errors": [{"target": "test#SomeError"}]
    },
    "test#TestStreamInputOutput": {
      "type": "structure",
      "members": {
        "value": {"target": "test#TestStream", "traits": {"smithy.api#required": {}}}
      }
    },
    "test#TestStream": {
      "type": "union",
      "members": {
        "MessageWithBlob": {"target": "test#MessageWithBlob"},
        "MessageWithHeaderAndPayload": {"target": "test#MessageWithHeaderAndPayload"},
        "MessageWithHeaders": {"target": "test#MessageWithHeaders"},
        "MessageWithNoHeaderPayloadTraits": {"target": "test#MessageWithNoHeaderPayloadTraits"},
        "MessageWithString": {"target": "test#MessageWithString"},
        "MessageWithStruct": {"target": "test#MessageWithStruct"},
        "MessageWithUnion": {"target": "test#MessageWithUnion"},
        "SomeError": {"target": "test#SomeError"}
      },
      "traits": {"smithy.api#streaming": {}}
    },
    "test#MessageWithBlob": {
      "type": "structure",
      "members": {
        "data": {"target": "smithy.api#Blob", "traits": {"smithy.api#eventPayload": {}}}
      }
    },
    "test#MessageWithString": {
      "type": "structure",
      "members": {
        "data": {"target": "smithy.api#String", "traits": {"smithy.api#eventPayload": {}}}
      }
    },
    "test#MessageWithStruct": {
      "type": "structure",
      "members": {
        "someStruct": {"target": "test#TestStruct", "traits": {"smithy.api#eventPayload": {}}}
      }
    },
    "test#MessageWithUnion": {
      "type": "structure",
      "members": {
        "someUnion": {"target": "test#TestUnion", "traits": {"smithy.api#eventPayload": {}}}
      }
    },
    "test#MessageWithHeaders": {
      "type": "structure",
      "members": {
        "blob": {"target": "smithy.api#Blob", "traits": {"smithy.api#eventHeader": {}}},
        "boolean": {"target": "smithy.api#Boolean", "traits": {"smithy.api#eventHeader": {}}},
        "int": {"target": "smithy.api#Integer", "traits": {"smithy.api#eventHeader": {}}},
        "long": {"target": "smithy.api#Long", "traits": {"smithy.api#eventHeader": {}}},
        "string": {"target": "smithy.api#String", "traits": {"smithy.api#eventHeader": {}}}
      }
    },
    "test#MessageWithHeaderAndPayload": {
      "type": "structure",
      "members": {
        "header": {"target": "smithy.api#String", "traits": {"smithy.api#eventHeader": {}}},
        "payload": {"target": "smithy.api#Blob", "traits": {"smithy.api#eventPayload": {}}}
      }
    },
    "test#MessageWithNoHeaderPayloadTraits": {
      "type": "structure",
      "members": {
        "someInt": {"target": "smithy.api#Integer"},
        "someString": {"target": "smithy.api#String"}
      }
    },
    "test#TestStruct": {
      "type": "structure",
      "members": {
        "someInt": {"target": "smithy.api#Integer"},
        "someString": {"target": "smithy.api#String"}
      }
    },
    "test#TestUnion": {
      "type": "union",
      "members": {
        "Bar": {"target": "smithy.api#Integer"},
        "Foo": {"target": "smithy.api#String"}
      }
    },
    "test#SomeError": {
      "type": "structure",
      "members": {
        "Message": {"target": "smithy.api#String"}
      },
      "traits": {"smithy.api#error": "client"}
    }
  }
})";

EventStreamTestCase json_case(Protocol protocol, const std::string& media_type) {
  EventStreamTestCase tc{protocol_trait_id(protocol), protocol, event_stream_model(protocol), media_type,
                         "application/vnd.amazon.eventstream", media_type,
                         R"({"someInt":5,"someString":"hello"})",
                         R"({"someInt":5,"someString":"hello"})",
                         R"({"Foo":"hello"})",
                         R"({"Message":"some error"})",
                         R"({"message":"unmodeled error"})"};
  return tc;
}

EventStreamTestCase xml_case(Protocol protocol) {
  EventStreamTestCase tc{
      protocol_trait_id(protocol),
      protocol,
      event_stream_model(protocol),
      "application/xml",
      "application/vnd.amazon.eventstream",
      "application/xml",
      "<TestStruct><someInt>5</someInt><someString>hello</someString></TestStruct>",
      "<MessageWithNoHeaderPayloadTraits><someInt>5</someInt><someString>hello</someString>"
      "</MessageWithNoHeaderPayloadTraits>",
      "<TestUnion><Foo>hello</Foo></TestUnion>",
      "<SomeError><Message>some error</Message></SomeError>",
      "<UnmodeledError><Message>unmodeled error</Message></UnmodeledError>"};
  return tc;
}

}  // namespace

PayloadFormat payload_format(Protocol protocol) {
  switch (protocol) {
    case Protocol::aws_json_1_0:
    case Protocol::aws_json_1_1:
    case Protocol::rest_json_1:
      return PayloadFormat::json;
    case Protocol::rest_xml:
      return PayloadFormat::xml;
    case Protocol::rpcv2_cbor:
      break;
  }
  throw Error(ErrorCode::unsupported_shape, "no event-stream payload codec for " + protocol_trait_id(protocol));
}

std::string event_stream_model_json(Protocol protocol) {
  std::string text = kEventStreamModel;
  const std::string placeholder = kProtocolPlaceholder;
  text.replace(text.find(placeholder), placeholder.size(), protocol_trait_id(protocol));
  return text;
}

Model event_stream_model(Protocol protocol) {
  return load_model_json(event_stream_model_json(protocol));
}

const std::vector<EventStreamTestCase>& event_stream_test_cases() {
  static const std::vector<EventStreamTestCase> cases = {
      json_case(Protocol::rest_json_1, "application/json"),
      json_case(Protocol::aws_json_1_0, "application/x-amz-json-1.0"),
      json_case(Protocol::aws_json_1_1, "application/x-amz-json-1.1"),
      xml_case(Protocol::rest_xml),
  };
  return cases;
}

}  // namespace shapeforge
