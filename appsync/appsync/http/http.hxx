#pragma once

#include <appsync/http/http-types.hxx>
#include <appsync/http/http-request.hxx>
#include <appsync/http/http-response.hxx>
#include <appsync/http/http-client.hxx>
