// ---------------------------------------------------------------------------
// default_rules.cpp
//
// 내장 화이트리스트와 위험 패턴 테이블 (순수 데이터, 로직 없음).
//
// [JQL 위험 패턴 — 원문 쿼리에 대해 검사]
//  1. ;\s*--                          — 구문 종료 후 SQL 라인 주석
//  2. ;\s*/\*                         — 구문 종료 후 SQL 블록 주석
//  3. ;\s*(union|select|...)\b        — 구문 종료 후 SQL 구문 (piggyback)
//  4. \bunion\s+(all\s+)?select\b     — UNION 기반 인젝션
//  5. \b(drop|truncate|alter)\s+table\b — DDL
//  6. \bexec\b                        — 저장 프로시저 실행
//  7. \bscript\b                      — 스크립트 인젝션
//  8. </?[a-z!][^<>]*>                — HTML/XML 태그
//  9. \$\{                            — 템플릿 보간
// 10. \\x[0-9a-f]{2}                  — hex 이스케이프
//
// [오탐/미탐 트레이드오프]
// - SQL 키워드 단독 출현(예: summary ~ "please select one" 의 "select")은
//   패턴 3·4·5 에 걸리지 않는다. 문자열 리터럴 안의 단어는 JQL 값으로만
//   해석되므로 허용하고, 리터럴 밖의 키워드는 SQL 키워드 가드(JqlValidator
//   6단계)가 별도로 차단한다. "DROP TABLE" 처럼 구문 형태를 갖추면 리터럴
//   안이라도 패턴 5 에 걸린다.
// - 패턴 8 은 '<' 바로 뒤에 문자가 오는 경우만 태그로 본다.
//   "created < now() AND updated > -1d" 같은 비교 연산자 조합은 통과하지만
//   "created <now() AND updated >x" 처럼 붙여 쓰면 오탐이 발생한다.
//
// [GraphQL 위험 패턴]
// __schema, __type(?!name) (__typename 은 허용), <script>, javascript:,
// data:, eval(, function(, ${, <!--, --> / --!>
// ---------------------------------------------------------------------------

#include "policy/rule.hpp"

JqlRules default_jql_rules() {
    JqlRules rules{};

    rules.allowed_fields = {
        // 표준 Jira 필드
        "project", "issuetype", "status", "priority", "assignee", "reporter",
        "created", "updated", "resolved", "summary", "description", "labels",
        "components", "fixversion", "affectedversion", "environment",
        "resolution", "key", "duedate", "originalestimate", "remainingestimate",
        "timespent", "worklogdate", "lastviewed", "voter", "watcher", "comment",
        "attachment",
        // Xray 테스트 관리 필드
        "testtype", "testplan", "testexecution", "testenvironment", "testset",
        "testrun", "testcycle", "requirement", "defect", "teststatus",
        "executedby", "executiondate", "testresult", "testrunstatus",
        "testexecutionstatus", "lasttestresult", "testplanstatus",
        "testsetstatus", "coveredrequirement", "testfolder", "testrepository",
        // 버전/이력
        "testversion", "testversiondate", "testhistory",
        // 실행 환경
        "testconfiguration", "testenvironmentname", "testbrowser",
        "testplatform", "testdevice",
        // Cucumber/BDD
        "scenario", "feature", "gherkintype",
        // 테스트 분류
        "testsuite", "testgroup", "testcategory",
    };

    rules.allowed_functions = {
        // 표준 Jira 함수
        "currentuser", "currentlogin", "membersof", "now",
        "startofday", "endofday", "startofweek", "endofweek",
        "startofmonth", "endofmonth", "startofyear", "endofyear",
        "startofquarter", "endofquarter",
        "earliestunreleasedversion", "latestreleasedversion",
        "releasedversions", "unreleasedversions",
        // Xray 함수
        "testexecutedby", "testlastexecutedby", "testexecutedin",
        "testplanfor", "testsetfor", "testcovering", "testcoveredby",
        "testexecutedinbuild", "testexecutedinversion", "testresultstatus",
        "testlastresultstatus", "testexecutionenvironment",
        "testrunenvironment", "testinfolder", "testinrepository", "testoftype",
        "linkedtests", "linkedrequirements", "linkeddefects", "childtests",
        "parenttests", "testexecutedondate", "testexecutedbetween",
        "testnotexecutedsince", "testwithresult", "testinplan", "testinset",
        "testinexecution",
        // 버전 함수
        "affectedversion", "fixversion", "testtargetversion",
    };

    // from/to 계열 술어(CHANGED FROM)는 SQL 키워드 가드와 충돌하므로 제외
    rules.keywords = {
        "and", "or", "not", "empty", "null", "order", "by", "asc", "desc",
        "in", "is", "was", "changed", "after", "before", "during", "on", "to",
    };

    rules.sql_keywords = {
        "select", "from", "where", "join", "union", "insert", "update",
        "delete", "drop", "exec",
    };

    rules.dangerous_patterns = {
        ";\\s*--",
        ";\\s*/\\*",
        ";\\s*(union|select|drop|delete|insert|update|exec|truncate|alter|create)\\b",
        "\\bunion\\s+(all\\s+)?select\\b",
        "\\b(drop|truncate|alter)\\s+table\\b",
        "\\bexec\\b",
        "\\bscript\\b",
        "</?[a-z!][^<>]*>",
        "\\$\\{",
        "\\\\x[0-9a-f]{2}",
    };

    return rules;
}

GraphqlRules default_graphql_rules() {
    GraphqlRules rules{};

    rules.allowed_queries = {
        "getTest", "getTests", "getTestExecution", "getTestExecutions",
        "getTestSet", "getTestSets", "getTestPlan", "getTestPlans",
        "getTestRun", "getTestRuns", "getPrecondition", "getPreconditions",
        "getTestRepository", "getTestRepositoryFolders", "getDataset",
        "getTestStatus", "getTestHistory", "getCoverableIssues",
        "getTestTypes", "getTestEnvironments", "getTestVersions",
        "getExpandedTest", "getFolder",
    };

    rules.allowed_mutations = {
        "createTest", "updateTest", "deleteTest",
        "createTestExecution", "updateTestExecution", "deleteTestExecution",
        "addTestsToTestExecution", "removeTestsFromTestExecution",
        "createTestSet", "updateTestSet", "deleteTestSet",
        "addTestsToTestSet", "removeTestsFromTestSet",
        "createTestPlan", "updateTestPlan", "deleteTestPlan",
        "addTestsToTestPlan", "removeTestsFromTestPlan",
        "createTestRun", "updateTestRun", "deleteTestRun",
        "createPrecondition", "updatePrecondition", "deletePrecondition",
        "updateGherkinDefinition", "moveTestToFolder",
        "updateTestRunStatus", "updateTestType",
    };

    rules.allowed_fields = {
        // 공통 필드
        "issueId", "projectId", "issueType", "jira", "key", "summary",
        "description", "status", "priority", "assignee", "reporter",
        "created", "updated", "resolved", "labels", "components",
        // 테스트
        "test", "testIssueFields", "testType", "testRepository", "folder",
        "gherkin", "unstructured", "steps", "preconditions", "datasets",
        "versions", "testResults", "lastTestResult", "testStatus",
        "testEnvironments", "action", "data", "result", "attachments",
        "filename", "path",
        // 테스트 실행
        "testExecution", "testExecutionStatus", "executedBy", "executionDate",
        "testRun", "testRunStatus", "environment", "startedOn", "finishedOn",
        "comment", "defects", "evidence", "color",
        // 테스트 조직
        "testSet", "testPlan", "testPlans", "testSets", "tests", "testExecutions",
        "totalTests", "passedTests", "failedTests", "blockedTests",
        // 페이지네이션/메타데이터
        "total", "start", "limit", "results", "warnings", "errors",
        "startAt", "maxResults", "isLast", "values",
        // 중첩 객체
        "name", "kind", "id", "displayName", "emailAddress", "active",
        "accountId", "self", "avatarUrls", "timeZone",
        // 버전/이력
        "version", "versionId", "versionNumber", "createdOn", "lastModified",
        // 오퍼레이션 인자
        "jql", "fields", "issueIds", "testIssueIds", "testExecIssueIds",
        "testPlanIssueIds", "testSetIssueIds", "projectKey", "folderPath",
        "testTypeName", "definition", "preconditionIssueId",
        // 커스텀 필드
        "customFields", "customfield_10001", "customfield_10002",
        "customfield_10003", "customfield_10004", "customfield_10005",
        // 클라이언트 캐시용
        "__typename",
    };

    rules.structural_keywords = {
        "query", "mutation", "fragment", "on", "true", "false", "null",
    };

    rules.suspicious_substrings = {"evil", "hack", "script"};

    rules.dangerous_patterns = {
        "__schema",
        "__type(?!name)",
        "<script[^>]*>",
        "javascript:",
        "data:",
        "eval\\s*\\(",
        "function\\s*\\(",
        "\\$\\{",
        "<!--",
        "--!?>",
    };

    return rules;
}

FirewallConfig default_firewall_config() {
    FirewallConfig cfg{};
    cfg.jql     = default_jql_rules();
    cfg.graphql = default_graphql_rules();
    return cfg;
}
